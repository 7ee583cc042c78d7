#pragma once
#include <string>
#include "job_source.hpp"

namespace Rotor {
namespace Jobs {

// Jobs from *.json link manifests: {name: url}, [{"name", "url"}] or [[name, url]].
// Names are sanitised and must be unique across all manifests.
class ManifestJobSource : public FileOutputJobSource {
public:
    ManifestJobSource(std::string manifest_dir, std::string output_dir);

    std::vector<std::shared_ptr<Rotor::Engine::Job>> enumerate() override;

private:
    std::string manifest_dir_;
    std::string output_dir_;
};

}  // namespace Jobs
}  // namespace Rotor

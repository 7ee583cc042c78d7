#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include "../../src/jobs/folder_job_source.hpp"
#include "../../src/jobs/manifest_job_source.hpp"

using namespace Rotor::Jobs;
using Rotor::Engine::Job;
namespace fs = std::filesystem;

class JobSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (fs::exists("test_jobs_out"))
            fs::remove_all("test_jobs_out");
        fs::create_directories("test_jobs_out/in");
    }

    void TearDown() override {
        if (fs::exists("test_jobs_out"))
            fs::remove_all("test_jobs_out");
    }

    void write(const std::string& path, const std::string& content) {
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    static std::vector<std::string> names(const std::vector<std::shared_ptr<Job>>& jobs) {
        std::vector<std::string> out;
        for (const auto& job : jobs)
            out.push_back(job->name());
        return out;
    }
};

TEST_F(JobSourceTest, FolderJobsAreSortedByFileName) {
    write("test_jobs_out/in/b.mp4", "b");
    write("test_jobs_out/in/a.mp4", "a");
    write("test_jobs_out/in/c.mp4", "c");
    fs::create_directories("test_jobs_out/in/subdir");

    FolderJobSource source("test_jobs_out/in", "test_jobs_out/out", ".html");
    auto            jobs = source.enumerate();

    EXPECT_EQ(names(jobs), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(fs::path(jobs[0]->input()), fs::path("test_jobs_out/in/a.mp4"));
    EXPECT_EQ(fs::path(jobs[0]->output()), fs::path("test_jobs_out/out/a.html"));
    EXPECT_TRUE(fs::is_directory("test_jobs_out/out"));
}

TEST_F(JobSourceTest, FolderMissingInputThrows) {
    FolderJobSource source("test_jobs_out/nowhere", "test_jobs_out/out", ".html");
    EXPECT_THROW(source.enumerate(), std::runtime_error);
}

TEST_F(JobSourceTest, OutputExistsChecksArtifact) {
    write("test_jobs_out/in/a.mp4", "a");
    FolderJobSource source("test_jobs_out/in", "test_jobs_out/out", ".html");
    auto            jobs = source.enumerate();

    EXPECT_FALSE(source.output_exists(*jobs[0]));
    write(jobs[0]->output(), "<html></html>");
    EXPECT_TRUE(source.output_exists(*jobs[0]));
}

TEST_F(JobSourceTest, ManifestObjectShapeKeepsOrder) {
    write("test_jobs_out/in/links.json",
          R"({"Zeta Report": "https://x/z", "alpha": "https://x/a"})");

    ManifestJobSource source("test_jobs_out/in", "test_jobs_out/out");
    auto              jobs = source.enumerate();

    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0]->name(), "Zeta_Report");
    EXPECT_EQ(jobs[0]->input(), "https://x/z");
    EXPECT_EQ(fs::path(jobs[0]->output()), fs::path("test_jobs_out/out/Zeta_Report.json"));
    EXPECT_EQ(jobs[1]->name(), "alpha");
}

TEST_F(JobSourceTest, ManifestListShapes) {
    write("test_jobs_out/in/a.json", R"([{"name": "one", "url": "u1"}])");
    write("test_jobs_out/in/b.json", R"([["two", "u2"], ["three", "u3"]])");

    ManifestJobSource source("test_jobs_out/in", "test_jobs_out/out");
    auto              jobs = source.enumerate();

    EXPECT_EQ(names(jobs), (std::vector<std::string>{"one", "two", "three"}));
    EXPECT_EQ(jobs[2]->input(), "u3");
}

TEST_F(JobSourceTest, ManifestStripsByteOrderMark) {
    write("test_jobs_out/in/a.json", "\xEF\xBB\xBF{\"doc\": \"u\"}");

    ManifestJobSource source("test_jobs_out/in", "test_jobs_out/out");
    auto              jobs = source.enumerate();

    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0]->name(), "doc");
}

TEST_F(JobSourceTest, ManifestDuplicateNamesAcrossFilesThrow) {
    write("test_jobs_out/in/a.json", R"({"same name": "u1"})");
    write("test_jobs_out/in/b.json", R"({"same/name": "u2"})");

    ManifestJobSource source("test_jobs_out/in", "test_jobs_out/out");
    try {
        source.enumerate();
        FAIL() << "expected duplicate name error";
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("same_name"), std::string::npos);
        EXPECT_NE(msg.find("a.json"), std::string::npos);
        EXPECT_NE(msg.find("b.json"), std::string::npos);
    }
}

TEST_F(JobSourceTest, ManifestAccentedNamesStayDistinct) {
    write("test_jobs_out/in/a.json", R"({"Lezione città": "u1"})");
    write("test_jobs_out/in/b.json", R"([["Lezione cittò", "u2"]])");

    ManifestJobSource source("test_jobs_out/in", "test_jobs_out/out");
    auto              jobs = source.enumerate();

    EXPECT_EQ(names(jobs), (std::vector<std::string>{"Lezione_città", "Lezione_cittò"}));
    EXPECT_EQ(fs::path(jobs[0]->output()), fs::path("test_jobs_out/out/Lezione_città.json"));
}

TEST_F(JobSourceTest, ManifestRejectsBadInput) {
    ManifestJobSource source("test_jobs_out/in", "test_jobs_out/out");

    // No manifests at all
    EXPECT_THROW(source.enumerate(), std::runtime_error);

    write("test_jobs_out/in/a.json", "   ");
    EXPECT_THROW(source.enumerate(), std::runtime_error);

    write("test_jobs_out/in/a.json", "{not json");
    EXPECT_THROW(source.enumerate(), std::runtime_error);

    write("test_jobs_out/in/a.json", R"([42])");
    EXPECT_THROW(source.enumerate(), std::runtime_error);

    write("test_jobs_out/in/a.json", R"("just a string")");
    EXPECT_THROW(source.enumerate(), std::runtime_error);
}

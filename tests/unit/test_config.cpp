#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include "../../src/core/config/config.hpp"

using namespace Rotor::Core;

TEST(ConfigTest, Defaults) {
    char* argv[] = {(char*)"rotor"};
    auto  config = Config::parse(1, argv);
    EXPECT_EQ(config.workers, 8);
    EXPECT_EQ(config.max_retries, 3);
    EXPECT_EQ(config.sweep_interval, 2000);
    EXPECT_EQ(config.max_proxy_age, 1800);
    EXPECT_EQ(config.proxy_file, "proxies.json");
    EXPECT_TRUE(config.headless);
    EXPECT_TRUE(config.command.empty());
}

TEST(ConfigTest, ComplexCLI) {
    char* argv[] = {(char*)"rotor",
                    (char*)"--input",
                    (char*)"chunks",
                    (char*)"-w",
                    (char*)"4",
                    (char*)"--max-retries",
                    (char*)"5",
                    (char*)"--no-headless",
                    (char*)"-l",
                    (char*)"debug",
                    (char*)"--",
                    (char*)"uploader",
                    (char*)"--proxy",
                    (char*)"{proxy}"};
    auto  config = Config::parse(14, argv);
    EXPECT_EQ(config.input_dir, "chunks");
    EXPECT_EQ(config.workers, 4);
    EXPECT_EQ(config.max_retries, 5);
    EXPECT_FALSE(config.headless);
    EXPECT_EQ(config.log_level, "debug");
    ASSERT_EQ(config.command.size(), 3u);
    EXPECT_EQ(config.command[0], "uploader");
    EXPECT_EQ(config.command[2], "{proxy}");
}

TEST(ConfigTest, YamlLoading) {
    std::string   yaml_content = R"(
        input: "audio_chunks"
        output: "transcripts"
        proxy_file: "pool.json"
        max_proxy_age: 600
        workers: 12
        proxy_retries: 4
        sweep_interval: 250
        headless: false
        log_level: warning
        command:
          - "upload.sh"
          - "{input}"
    )";
    std::ofstream ofs("test_config.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {(char*)"rotor", (char*)"--config", (char*)"test_config.yaml"};
    auto  config = Config::parse(3, argv);

    EXPECT_EQ(config.input_dir, "audio_chunks");
    EXPECT_EQ(config.output_dir, "transcripts");
    EXPECT_EQ(config.proxy_file, "pool.json");
    EXPECT_EQ(config.max_proxy_age, 600);
    EXPECT_EQ(config.workers, 12);
    EXPECT_EQ(config.max_retries, 4);
    EXPECT_EQ(config.sweep_interval, 250);
    EXPECT_FALSE(config.headless);
    EXPECT_EQ(config.log_level, "warning");
    ASSERT_EQ(config.command.size(), 2u);
    EXPECT_EQ(config.command[1], "{input}");

    std::remove("test_config.yaml");
}

TEST(ConfigTest, CliOverridesYaml) {
    std::string   yaml_content = "workers: 20\nmax_retries: 6";
    std::ofstream ofs("test_ovr.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {
        (char*)"rotor", (char*)"--config", (char*)"test_ovr.yaml", (char*)"--workers", (char*)"2"};
    auto config = Config::parse(5, argv);

    EXPECT_EQ(config.workers, 2);
    EXPECT_EQ(config.max_retries, 6);

    std::remove("test_ovr.yaml");
}

TEST(ConfigTest, InvalidYaml) {
    std::ofstream ofs("invalid.yaml");
    ofs << "workers: [not an integer]";
    ofs.close();

    const char* argv[] = {"rotor", "--config", "invalid.yaml"};
    EXPECT_THROW(Config::parse(3, (char**)argv), std::runtime_error);
    std::remove("invalid.yaml");
}

TEST(ConfigTest, CommandMustBeSequence) {
    std::ofstream ofs("scalar_cmd.yaml");
    ofs << "command: upload.sh";
    ofs.close();

    const char* argv[] = {"rotor", "--config", "scalar_cmd.yaml"};
    EXPECT_THROW(Config::parse(3, (char**)argv), std::runtime_error);
    std::remove("scalar_cmd.yaml");
}

TEST(ConfigTest, NonExistentFile) {
    const char* argv[] = {"rotor", "--config", "does_not_exist.yaml"};
    EXPECT_THROW(Config::parse(3, (char**)argv), std::runtime_error);
}

TEST(ConfigTest, EmptyConfig) {
    std::ofstream ofs("empty.yaml");
    ofs << "";
    ofs.close();

    char* argv[] = {(char*)"rotor", (char*)"--config", (char*)"empty.yaml"};
    auto  config = Config::parse(3, argv);
    EXPECT_EQ(config.workers, 8);

    std::remove("empty.yaml");
}

TEST(ConfigTest, Validate) {
    Config config;
    EXPECT_THROW(config.validate(), std::invalid_argument);  // no command

    config.command = {"upload.sh"};
    EXPECT_NO_THROW(config.validate());

    config.workers = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);
    config.workers = 1;

    config.max_retries = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);
    config.max_retries = 3;

    config.sweep_interval = -1;
    EXPECT_THROW(config.validate(), std::invalid_argument);
    config.sweep_interval = 0;
    EXPECT_NO_THROW(config.validate());

    config.max_runs = 0;
    EXPECT_NO_THROW(config.validate());
    config.max_runs = -1;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

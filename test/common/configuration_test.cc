#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include "../../src/common/configuration.h"

using namespace ChunkSink;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override { Configuration::getInstance().reset(); }

    void TearDown() override {
        unsetenv("CHUNKSINK_JOB_WORKERS");
        unsetenv("CHUNKSINK_SINK_MODE");
        unsetenv("CHUNKSINK_OUTPUT_FORCE_SYNC");
        Configuration::getInstance().reset();
    }
};

TEST_F(ConfigurationTest, DefaultsAreValid) {
    Configuration& config = Configuration::getInstance();
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.config().job.num_records.get(), 200u);
    EXPECT_EQ(config.config().job.first_code.get(), 10001);
    EXPECT_EQ(config.getChunkSize(), 1u);
    EXPECT_EQ(config.getNumWorkers(), 2);
    EXPECT_EQ(config.getSinkMode(), "ordered");
    EXPECT_EQ(config.config().output.prefix.get(), "mydata");
}

TEST_F(ConfigurationTest, LoadsYaml) {
    Configuration& config = Configuration::getInstance();
    ASSERT_TRUE(config.loadFromString(R"(
chunksink:
  job:
    num_records: 1000
    chunk_size: 7
    num_workers: 16
  output:
    prefix: export
    force_sync: false
  sink:
    mode: unordered
  repro:
    loop_count: 3
)"));
    EXPECT_EQ(config.config().job.num_records.get(), 1000u);
    EXPECT_EQ(config.getChunkSize(), 7u);
    EXPECT_EQ(config.getNumWorkers(), 16);
    EXPECT_EQ(config.config().output.prefix.get(), "export");
    EXPECT_FALSE(config.config().output.force_sync.get());
    EXPECT_EQ(config.getSinkMode(), "unordered");
    EXPECT_EQ(config.config().repro.loop_count.get(), 3);
    // Untouched keys keep their defaults
    EXPECT_EQ(config.config().job.first_code.get(), 10001);
}

TEST_F(ConfigurationTest, LoadsFile) {
    auto path = std::filesystem::temp_directory_path() /
                ("chunksink_config_" + std::to_string(::getpid()) + ".yaml");
    {
        std::ofstream out(path);
        out << "chunksink:\n  job:\n    num_workers: 5\n";
    }
    Configuration& config = Configuration::getInstance();
    EXPECT_TRUE(config.loadFromFile(path.string()));
    EXPECT_EQ(config.getNumWorkers(), 5);
    std::filesystem::remove(path);

    EXPECT_FALSE(config.loadFromFile(path.string()));
}

TEST_F(ConfigurationTest, EnvironmentOverridesYaml) {
    Configuration& config = Configuration::getInstance();
    ASSERT_TRUE(config.loadFromString("chunksink:\n  job:\n    num_workers: 4\n"));
    setenv("CHUNKSINK_JOB_WORKERS", "12", 1);
    setenv("CHUNKSINK_OUTPUT_FORCE_SYNC", "off", 1);
    EXPECT_EQ(config.getNumWorkers(), 12);
    EXPECT_FALSE(config.config().output.force_sync.get());

    unsetenv("CHUNKSINK_JOB_WORKERS");
    EXPECT_EQ(config.getNumWorkers(), 4);
}

TEST_F(ConfigurationTest, UnparsableEnvironmentFallsBack) {
    setenv("CHUNKSINK_JOB_WORKERS", "many", 1);
    EXPECT_EQ(Configuration::getInstance().getNumWorkers(), 2);
}

TEST_F(ConfigurationTest, BooleanEnvironmentValues) {
    const ConfigValue<bool>& force_sync = Configuration::getInstance().config().output.force_sync;
    setenv("CHUNKSINK_OUTPUT_FORCE_SYNC", "NO", 1);
    EXPECT_FALSE(force_sync.get());
    setenv("CHUNKSINK_OUTPUT_FORCE_SYNC", "Yes", 1);
    EXPECT_TRUE(force_sync.get());

    // Non-ASCII bytes are not a boolean; the configured value stays in effect
    Configuration::getInstance().config().output.force_sync.set(false);
    setenv("CHUNKSINK_OUTPUT_FORCE_SYNC", "\xC3\x89\xFF", 1);
    EXPECT_FALSE(force_sync.get());
}

TEST_F(ConfigurationTest, ReportsValidationErrors) {
    Configuration& config = Configuration::getInstance();
    EXPECT_FALSE(config.loadFromString(
            "chunksink:\n  job:\n    chunk_size: 0\n    num_workers: 0\n  sink:\n    mode: random\n"));
    auto errors = config.getValidationErrors();
    EXPECT_EQ(errors.size(), 3u);

    config.reset();
    EXPECT_TRUE(config.validate());
    EXPECT_TRUE(config.getValidationErrors().empty());
}

TEST_F(ConfigurationTest, EnvironmentModeIsValidated) {
    setenv("CHUNKSINK_SINK_MODE", "shuffled", 1);
    EXPECT_FALSE(Configuration::getInstance().validate());
}

TEST_F(ConfigurationTest, MalformedYamlIsRejected) {
    EXPECT_FALSE(Configuration::getInstance().loadFromString("chunksink: [unclosed"));
}

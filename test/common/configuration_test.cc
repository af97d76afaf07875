#include <gtest/gtest.h>
#include "../../src/common/configuration.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace Cadence;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("CADENCE_EXECUTOR_THREADS");
        unsetenv("CADENCE_MAX_EVENTS_PER_DRAIN");
        Configuration::getInstance().resetToDefaults();
    }

    void TearDown() override {
        unsetenv("CADENCE_EXECUTOR_THREADS");
        unsetenv("CADENCE_MAX_EVENTS_PER_DRAIN");
        Configuration::getInstance().resetToDefaults();
    }

    Configuration& config_ = Configuration::getInstance();
};

TEST_F(ConfigurationTest, Defaults) {
    EXPECT_EQ(config_.getExecutorThreads(), 4);
    EXPECT_EQ(config_.getMaxEventsPerDrain(), 0);
    EXPECT_EQ(config_.getLogVerbosity(), 0);
    EXPECT_TRUE(config_.validate());
}

TEST_F(ConfigurationTest, LoadFromString) {
    const std::string yaml = R"(
cadence:
  executor:
    num_threads: 12
  scheduler:
    max_events_per_drain: 64
  logging:
    verbosity: 2
)";
    ASSERT_TRUE(config_.loadFromString(yaml));
    EXPECT_EQ(config_.getExecutorThreads(), 12);
    EXPECT_EQ(config_.getMaxEventsPerDrain(), 64);
    EXPECT_EQ(config_.getLogVerbosity(), 2);
}

TEST_F(ConfigurationTest, PartialYAMLKeepsOtherDefaults) {
    ASSERT_TRUE(config_.loadFromString("cadence:\n  scheduler:\n    max_events_per_drain: 8\n"));
    EXPECT_EQ(config_.getMaxEventsPerDrain(), 8);
    EXPECT_EQ(config_.getExecutorThreads(), 4);
}

TEST_F(ConfigurationTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "cadence_config_test.yaml";
    {
        std::ofstream out(path);
        out << "cadence:\n  executor:\n    num_threads: 6\n";
    }
    EXPECT_TRUE(config_.loadFromFile(path));
    EXPECT_EQ(config_.getExecutorThreads(), 6);
    std::remove(path.c_str());
}

TEST_F(ConfigurationTest, MissingFileFails) {
    EXPECT_FALSE(config_.loadFromFile("/nonexistent/cadence.yaml"));
}

TEST_F(ConfigurationTest, MalformedYAMLFails) {
    EXPECT_FALSE(config_.loadFromString("cadence: [unterminated"));
}

TEST_F(ConfigurationTest, InvalidThreadCountFailsValidation) {
    EXPECT_FALSE(config_.loadFromString("cadence:\n  executor:\n    num_threads: 0\n"));
    auto errors = config_.getValidationErrors();
    ASSERT_EQ(errors.size(), 1);
    EXPECT_NE(errors[0].find("Executor threads"), std::string::npos);
}

TEST_F(ConfigurationTest, EnvironmentOverridesConfiguredValue) {
    config_.config().executor.num_threads.set(3);
    setenv("CADENCE_EXECUTOR_THREADS", "9", 1);
    EXPECT_EQ(config_.getExecutorThreads(), 9);

    setenv("CADENCE_EXECUTOR_THREADS", "not-a-number", 1);
    EXPECT_EQ(config_.getExecutorThreads(), 3);
}

TEST_F(ConfigurationTest, EnvironmentOverridesDrainBatchSize) {
    ASSERT_TRUE(config_.loadFromString("cadence:\n  scheduler:\n    max_events_per_drain: 16\n"));
    setenv("CADENCE_MAX_EVENTS_PER_DRAIN", "128", 1);
    EXPECT_EQ(config_.getMaxEventsPerDrain(), 128);

    unsetenv("CADENCE_MAX_EVENTS_PER_DRAIN");
    EXPECT_EQ(config_.getMaxEventsPerDrain(), 16);
}

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "../../src/allocator/id_allocator.h"
#include "../../src/common/configuration.h"

using namespace Tessera;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("TESSERA_BLOCK_SIZE");
        unsetenv("TESSERA_ID_KEY");
        Configuration::getInstance().reset();
    }

    Configuration& configuration() { return Configuration::getInstance(); }
};

TEST_F(ConfigurationTest, DefaultsAreValid) {
    EXPECT_TRUE(configuration().validate());
    EXPECT_EQ(configuration().getServerPort(), COUNTER_SERVICE_PORT);
    EXPECT_EQ(configuration().getIdKey(), DEFAULT_ID_KEY);
    EXPECT_EQ(configuration().getMinId(), DEFAULT_MIN_ID);
    EXPECT_EQ(configuration().getBlockSize(), DEFAULT_BLOCK_SIZE);
}

TEST_F(ConfigurationTest, LoadFromString) {
    const std::string yaml = R"(
tessera:
  server:
    port: 50999
  client:
    server_address: counter-0:50999
  allocator:
    id_key: node-id-generator
    min_id: 2
    block_size: 100
    retry:
      initial_backoff_ms: 10
      max_backoff_ms: 500
      multiplier: 3
)";
    ASSERT_TRUE(configuration().loadFromString(yaml));

    EXPECT_EQ(configuration().getServerPort(), 50999);
    EXPECT_EQ(configuration().getServerAddress(), "counter-0:50999");
    EXPECT_EQ(configuration().getIdKey(), "node-id-generator");
    EXPECT_EQ(configuration().getMinId(), 2);
    EXPECT_EQ(configuration().getBlockSize(), 100);

    RetryOptions retry = RetryOptions::FromConfig(configuration().config());
    EXPECT_EQ(retry.initial_backoff, absl::Milliseconds(10));
    EXPECT_EQ(retry.max_backoff, absl::Milliseconds(500));
    EXPECT_EQ(retry.multiplier, 3);
}

TEST_F(ConfigurationTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "tessera_configuration_test.yaml";
    {
        std::ofstream out(path);
        out << "tessera:\n  allocator:\n    block_size: 64\n";
    }
    EXPECT_TRUE(configuration().loadFromFile(path.string()));
    EXPECT_EQ(configuration().getBlockSize(), 64);
    std::filesystem::remove(path);
}

TEST_F(ConfigurationTest, MissingFileFails) {
    EXPECT_FALSE(configuration().loadFromFile("/nonexistent/tessera.yaml"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    ASSERT_TRUE(configuration().loadFromString("tessera:\n  allocator:\n    block_size: 64\n"));
    setenv("TESSERA_BLOCK_SIZE", "128", 1);
    setenv("TESSERA_ID_KEY", "table-id-generator", 1);

    EXPECT_EQ(configuration().getBlockSize(), 128);
    EXPECT_EQ(configuration().getIdKey(), "table-id-generator");
}

TEST_F(ConfigurationTest, UnparsableEnvironmentFallsBack) {
    setenv("TESSERA_BLOCK_SIZE", "lots", 1);
    EXPECT_EQ(configuration().getBlockSize(), DEFAULT_BLOCK_SIZE);
}

TEST_F(ConfigurationTest, ValidationErrors) {
    EXPECT_FALSE(configuration().loadFromString(R"(
tessera:
  server:
    port: 80
  allocator:
    min_id: 0
    block_size: 0
    retry:
      initial_backoff_ms: 100
      max_backoff_ms: 10
)"));
    auto errors = configuration().getValidationErrors();
    EXPECT_EQ(errors.size(), 4u);
}

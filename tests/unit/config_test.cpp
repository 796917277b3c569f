#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace keylight;
using namespace keylight::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "keylight_config_test";
        fs::create_directories(temp_dir);
        unsetenv("KEYLIGHT_ADDRESSES");
        unsetenv("KEYLIGHT_COUNT");
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
        unsetenv("KEYLIGHT_ADDRESSES");
        unsetenv("KEYLIGHT_COUNT");
    }

    std::string create_config_file(const std::string& name, const std::string& content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    KeylightConfig config;
    std::string error;

    EXPECT_TRUE(validate_config(config, error)) << error;
    EXPECT_EQ(config.discovery.device_count, 1);
    EXPECT_EQ(config.discovery.timeout_ms, 5000);
    EXPECT_EQ(config.discovery.service_type, "_elg._tcp");
    EXPECT_TRUE(config.discovery.addresses.empty());
    EXPECT_EQ(config.discovery.partial_policy, discovery::PartialPolicy::ACCEPT);
}

TEST_F(ConfigTest, FullConfig) {
    std::string config_content = R"(
discovery:
  device_count: "2"
  service_type: _elg._tcp
  timeout_ms: 3000
  partial_policy: fail

client:
  timeout_ms: 1500

logging:
  level: debug
)";

    std::string config_path = create_config_file("full.yaml", config_content);
    KeylightConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_TRUE(validate_config(config, error)) << error;
    EXPECT_EQ(config.discovery.device_count, 2);
    EXPECT_EQ(config.discovery.timeout_ms, 3000);
    EXPECT_EQ(config.discovery.partial_policy, discovery::PartialPolicy::FAIL);
    EXPECT_EQ(config.client.timeout_ms, 1500);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, IntegerDeviceCountAccepted) {
    std::string config_path = create_config_file("int_count.yaml", "discovery:\n  device_count: 3\n");
    KeylightConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << error;
    EXPECT_EQ(config.discovery.device_count, 3);
}

TEST_F(ConfigTest, InvalidDeviceCount) {
    std::string config_path = create_config_file("bad_count.yaml", "discovery:\n  device_count: \"two\"\n");
    KeylightConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("device_count"), std::string::npos);
}

TEST_F(ConfigTest, StaticAddressesAsString) {
    std::string config_path =
        create_config_file("static.yaml", "discovery:\n  addresses: \"192.168.1.10, 192.168.1.11\"\n");
    KeylightConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << error;
    EXPECT_EQ(config.discovery.addresses, "192.168.1.10, 192.168.1.11");
    EXPECT_TRUE(validate_config(config, error)) << error;
}

TEST_F(ConfigTest, StaticAddressesAsSequence) {
    std::string config_content = R"(
discovery:
  addresses:
    - 192.168.1.10
    - 192.168.1.11
)";
    std::string config_path = create_config_file("static_seq.yaml", config_content);
    KeylightConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << error;
    EXPECT_EQ(config.discovery.addresses, "192.168.1.10,192.168.1.11");
}

TEST_F(ConfigTest, EmptyStaticEntryFailsValidation) {
    KeylightConfig config;
    config.discovery.addresses = "192.168.1.10,,192.168.1.11";
    std::string error;

    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("discovery.addresses"), std::string::npos);
}

TEST_F(ConfigTest, InvalidPartialPolicy) {
    std::string config_path = create_config_file("policy.yaml", "discovery:\n  partial_policy: sometimes\n");
    KeylightConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("partial_policy"), std::string::npos);
}

TEST_F(ConfigTest, InvalidLogLevel) {
    std::string config_path = create_config_file("log.yaml", "logging:\n  level: verbose\n");
    KeylightConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("log level"), std::string::npos);
}

TEST_F(ConfigTest, TimeoutOutOfRange) {
    KeylightConfig config;
    std::string error;

    config.discovery.timeout_ms = 50;
    EXPECT_FALSE(validate_config(config, error));

    config.discovery.timeout_ms = 5000;
    config.client.timeout_ms = 10;
    EXPECT_FALSE(validate_config(config, error));
}

TEST_F(ConfigTest, UnknownTopLevelKeyIsIgnored) {
    std::string config_path = create_config_file("unknown.yaml", "extra:\n  value: 1\nlogging:\n  level: warn\n");
    KeylightConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << error;
    EXPECT_EQ(config.logging.level, "warn");
}

TEST_F(ConfigTest, MissingFileFails) {
    KeylightConfig config;
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "missing.yaml").string(), config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("KEYLIGHT_ADDRESSES", "10.0.0.5,10.0.0.6", 1);
    setenv("KEYLIGHT_COUNT", "4", 1);

    KeylightConfig config;
    std::string error;
    ASSERT_TRUE(apply_environment(config, error)) << error;
    EXPECT_EQ(config.discovery.addresses, "10.0.0.5,10.0.0.6");
    EXPECT_EQ(config.discovery.device_count, 4);
}

TEST_F(ConfigTest, InvalidEnvironmentCount) {
    setenv("KEYLIGHT_COUNT", "0", 1);

    KeylightConfig config;
    std::string error;
    EXPECT_FALSE(apply_environment(config, error));
    EXPECT_NE(error.find("KEYLIGHT_COUNT"), std::string::npos);
}

TEST(DeviceCountTest, ParsesStringEncodedIntegers) {
    int count = 0;
    std::string error;

    EXPECT_TRUE(parse_device_count("2", count, error));
    EXPECT_EQ(count, 2);
    EXPECT_TRUE(parse_device_count(" 7 ", count, error));
    EXPECT_EQ(count, 7);

    EXPECT_FALSE(parse_device_count("", count, error));
    EXPECT_FALSE(parse_device_count("2x", count, error));
    EXPECT_FALSE(parse_device_count("-1", count, error));
    EXPECT_FALSE(parse_device_count("0", count, error));
    EXPECT_FALSE(parse_device_count("99999999999", count, error));
}

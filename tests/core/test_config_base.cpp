// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "trade_store/core/config_base.hpp"
#include "trade_store/core/logger.hpp"

using namespace trade_store;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "trade_store_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    void write_file(const std::string& name, const std::string& content) {
        std::ofstream file(test_dir / name);
        file << content;
    }

    std::filesystem::path test_dir;
};

// Minimal config in the shape of DatabaseConfig: a few fields and one range check
class RetryConfig : public ConfigBase {
public:
    std::string host = "localhost";
    int attempts = 3;
    double backoff_seconds = 0.5;

    std::string config_name() const override {
        return "RetryConfig";
    }

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["host"] = host;
        j["attempts"] = attempts;
        j["backoff_seconds"] = backoff_seconds;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        read_field(j, "host", host);
        read_field(j, "attempts", attempts);
        read_field(j, "backoff_seconds", backoff_seconds);
    }

    Result<void> validate() const override {
        if (attempts < 1) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT, "attempts must be positive",
                                    config_name());
        }
        return Result<void>();
    }
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    RetryConfig config;
    config.host = "db.internal";
    config.attempts = 5;
    config.backoff_seconds = 1.5;

    std::filesystem::path file_path = test_dir / "retry.json";
    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok()) << save_result.error()->what();
    ASSERT_TRUE(std::filesystem::exists(file_path));

    RetryConfig loaded;
    auto load_result = loaded.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok()) << load_result.error()->what();
    EXPECT_EQ(loaded.host, "db.internal");
    EXPECT_EQ(loaded.attempts, 5);
    EXPECT_DOUBLE_EQ(loaded.backoff_seconds, 1.5);
}

TEST_F(ConfigBaseTest, AbsentKeysKeepDefaults) {
    RetryConfig config;
    ASSERT_TRUE(config.load_from_json({{"host", "replica"}}).is_ok());

    EXPECT_EQ(config.host, "replica");
    EXPECT_EQ(config.attempts, 3);
    EXPECT_DOUBLE_EQ(config.backoff_seconds, 0.5);
}

TEST_F(ConfigBaseTest, MalformedFileIsParseError) {
    write_file("invalid.json", "{ this is not valid JSON }");

    RetryConfig config;
    auto result = config.load_from_file((test_dir / "invalid.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, MissingFile) {
    RetryConfig config;
    auto result = config.load_from_file((test_dir / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, WrongValueTypeIsInvalidArgument) {
    RetryConfig config;
    auto result = config.load_from_json({{"attempts", "three"}});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(result.error()->component(), "RetryConfig");
}

TEST_F(ConfigBaseTest, NonObjectRejected) {
    RetryConfig config;
    auto result = config.load_from_json(nlohmann::json::array({1, 2}));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigBaseTest, LoadRunsValidate) {
    write_file("zero.json", R"({"attempts": 0})");

    RetryConfig config;
    auto result = config.load_from_file((test_dir / "zero.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigBaseTest, SaveRefusesInvalidConfig) {
    RetryConfig config;
    config.attempts = 0;

    std::filesystem::path file_path = test_dir / "refused.json";
    auto result = config.save_to_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(std::filesystem::exists(file_path));
}

TEST_F(ConfigBaseTest, LoggerConfigSerialization) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "admin";

    nlohmann::json j = config.to_json();
    EXPECT_EQ(j["min_level"], "DEBUG");
    EXPECT_EQ(j["destination"], "BOTH");

    LoggerConfig loaded;
    ASSERT_TRUE(loaded.load_from_json(j).is_ok());
    EXPECT_EQ(loaded.min_level, LogLevel::DEBUG);
    EXPECT_EQ(loaded.destination, LogDestination::BOTH);
    EXPECT_EQ(loaded.filename_prefix, "admin");
}

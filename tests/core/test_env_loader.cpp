#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "trade_store/core/env_loader.hpp"

using namespace trade_store;

class EnvLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "trade_store_env_loader_test";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir / "nested" / "deeper");
        unsetenv("TRADE_STORE_ENV_A");
        unsetenv("TRADE_STORE_ENV_B");
        unsetenv("TRADE_STORE_ENV_C");
    }

    void TearDown() override {
        unsetenv("TRADE_STORE_ENV_A");
        unsetenv("TRADE_STORE_ENV_B");
        unsetenv("TRADE_STORE_ENV_C");
        std::filesystem::remove_all(test_dir);
    }

    void write_env(const std::filesystem::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    std::filesystem::path test_dir;
};

TEST_F(EnvLoaderTest, LoadsKeyValuePairs) {
    auto path = test_dir / ".env";
    write_env(path,
              "# comment line\n"
              "\n"
              "TRADE_STORE_ENV_A=plain\n"
              "export TRADE_STORE_ENV_B=\"quoted value\"\n"
              "TRADE_STORE_ENV_C = 'single'\n"
              "not a pair\n");

    auto result = EnvLoader::load(path.string());
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value(), 3u);

    EXPECT_STREQ(std::getenv("TRADE_STORE_ENV_A"), "plain");
    EXPECT_STREQ(std::getenv("TRADE_STORE_ENV_B"), "quoted value");
    EXPECT_STREQ(std::getenv("TRADE_STORE_ENV_C"), "single");
}

TEST_F(EnvLoaderTest, KeepsExistingVariablesUnlessOverwriting) {
    setenv("TRADE_STORE_ENV_A", "from_process", 1);
    auto path = test_dir / ".env";
    write_env(path, "TRADE_STORE_ENV_A=from_file\n");

    auto kept = EnvLoader::load(path.string());
    ASSERT_TRUE(kept.is_ok());
    EXPECT_EQ(kept.value(), 0u);
    EXPECT_STREQ(std::getenv("TRADE_STORE_ENV_A"), "from_process");

    auto replaced = EnvLoader::load(path.string(), true);
    ASSERT_TRUE(replaced.is_ok());
    EXPECT_EQ(replaced.value(), 1u);
    EXPECT_STREQ(std::getenv("TRADE_STORE_ENV_A"), "from_file");
}

TEST_F(EnvLoaderTest, MissingFile) {
    auto result = EnvLoader::load((test_dir / "absent.env").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(EnvLoaderTest, FindSearchesParentDirectories) {
    write_env(test_dir / "store.env", "TRADE_STORE_ENV_A=1\n");

    auto found = EnvLoader::find((test_dir / "nested" / "deeper").string(), "store.env");
    ASSERT_TRUE(found.is_ok()) << found.error()->what();
    EXPECT_EQ(std::filesystem::path(found.value()), test_dir / "store.env");
}

TEST_F(EnvLoaderTest, FindReportsAbsentFile) {
    auto found = EnvLoader::find(test_dir.string(), "trade_store_no_such_file.env");
    ASSERT_TRUE(found.is_error());
    EXPECT_EQ(found.error()->code(), ErrorCode::DATA_NOT_FOUND);
}

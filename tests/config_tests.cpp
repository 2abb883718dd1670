#include <gtest/gtest.h>
#include "tagattest/sdk/Config.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace tagattest::sdk;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("tagattest_config_" + std::to_string(getpid()) + ".conf")).string();
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void write(const std::string& content) {
        std::ofstream file(path_, std::ios::trunc);
        file << content;
    }

    std::string path_;
};

} // namespace

TEST_F(ConfigTest, DefaultsWithoutFile) {
    AttestConfig config;
    EXPECT_TRUE(config.log_path.empty());
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.store_path, constants::ATTESTATION_STORE_PATH);
    EXPECT_EQ(config.hash_threads, constants::DEFAULT_THREAD_POOL_SIZE);
    EXPECT_EQ(config.anchor_retries, constants::DEFAULT_ANCHOR_RETRIES);
    EXPECT_EQ(config.anchor_backoff_ms, 200u);
}

TEST_F(ConfigTest, LoadsAllKeys) {
    write("# tagattest settings\n"
          "\n"
          "log_path = /tmp/tagattest-logs\n"
          "log_level=debug\n"
          "  store_path =  /tmp/anchors  \n"
          "hash_threads = 8\n"
          "parallel_threshold = 100\n"
          "anchor_retries = 0\n"
          "anchor_backoff_ms = 50\r\n");

    auto config = load_config(path_);
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().log_path, "/tmp/tagattest-logs");
    EXPECT_EQ(config.value().log_level, "debug");
    EXPECT_EQ(config.value().store_path, "/tmp/anchors");
    EXPECT_EQ(config.value().hash_threads, 8u);
    EXPECT_EQ(config.value().parallel_threshold, 100u);
    EXPECT_EQ(config.value().anchor_retries, 0u);
    EXPECT_EQ(config.value().anchor_backoff_ms, 50u);
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    write("hash_threads = 2\n");
    auto config = load_config(path_);
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().hash_threads, 2u);
    EXPECT_EQ(config.value().parallel_threshold, constants::DEFAULT_PARALLEL_THRESHOLD);
}

TEST_F(ConfigTest, MissingFileIsNotFound) {
    auto config = load_config(path_ + ".missing");
    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.error(), ErrorCode::NOT_FOUND);
}

TEST_F(ConfigTest, RejectsBadLines) {
    const std::vector<std::string> bad = {
        "unknown_key = 1\n",
        "hash_threads = many\n",
        "hash_threads = -4\n",
        "hash_threads = 0\n",
        "anchor_retries = 99999999999999999999999\n",
        "log_level = loud\n",
        "store_path =\n",
        "just some text\n",
    };
    for (const auto& content : bad) {
        write(content);
        auto config = load_config(path_);
        ASSERT_TRUE(config.is_err()) << content;
        EXPECT_EQ(config.error(), ErrorCode::CONFIG_ERROR) << content;
    }
}

TEST_F(ConfigTest, ApplyConfigValueOverrides) {
    AttestConfig config;
    EXPECT_TRUE(apply_config_value(config, "log_level", "warning").is_ok());
    EXPECT_EQ(config.log_level, "warning");
    EXPECT_EQ(apply_config_value(config, "log_level", "WARN").error(), ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(config.log_level, "warning");
}

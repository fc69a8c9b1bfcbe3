#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "util/ScratchDir.hpp"
#include "ArchiveFixtures.hpp"

using namespace ts::config;

class ConfigTest : public ::testing::Test {
protected:
    ts::util::ScratchDir dir;

    std::string write(const std::string& yaml) const {
        const auto path = dir.path() / "tarsync.yaml";
        ts::test::writeFile(path, yaml);
        return path.string();
    }
};

TEST_F(ConfigTest, DefaultsWhenEmpty) {
    const auto cfg = loadConfig(write(""));
    EXPECT_EQ(cfg.server.port, 8090);
    EXPECT_EQ(cfg.server.archive_root, "/tmp/");
    EXPECT_EQ(cfg.server.max_request_bytes, MAX_REQUEST_BYTES);
    EXPECT_EQ(cfg.server.keep_alive_timeout, std::chrono::seconds(5));
    EXPECT_TRUE(cfg.client.preserve_order);
    EXPECT_EQ(cfg.client.archive_suffix, ".tgz");
    EXPECT_FALSE(cfg.debug);
}

TEST_F(ConfigTest, ReadsSections) {
    const auto cfg = loadConfig(write(R"(
server:
  host: 127.0.0.1
  port: 9000
  archive_root: /srv/archives
  threads: 2
  io_timeout_seconds: 30
  keep_alive_timeout_seconds: 0
  max_request_bytes_kb: 64
client:
  preserve_order: false
  bitmap_compression_level: 1
logging:
  log_dir: /var/log/tarsync
  log_levels:
    console_log_level: warn
    subsystem_levels:
      http: error
)"));

    EXPECT_EQ(cfg.server.host, "127.0.0.1");
    EXPECT_EQ(cfg.server.port, 9000);
    EXPECT_EQ(cfg.server.archive_root, "/srv/archives");
    EXPECT_EQ(cfg.server.threads, 2u);
    EXPECT_EQ(cfg.server.io_timeout, std::chrono::seconds(30));
    EXPECT_EQ(cfg.server.keep_alive_timeout, std::chrono::seconds(0));
    EXPECT_EQ(cfg.server.max_request_bytes, 64u * 1024);
    EXPECT_FALSE(cfg.client.preserve_order);
    EXPECT_EQ(cfg.client.bitmap_compression_level, 1);
    EXPECT_EQ(cfg.logging.log_dir, "/var/log/tarsync");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.http, spdlog::level::err);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sync, spdlog::level::info);
}

TEST_F(ConfigTest, DebugLowersEveryLevel) {
    const auto cfg = loadConfig(write("debug: true\n"));
    EXPECT_TRUE(cfg.debug);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.archive, spdlog::level::debug);
}

TEST_F(ConfigTest, ApplyDebugKeepsTraceLevels) {
    Config cfg;
    cfg.logging.levels.file_log_level = spdlog::level::trace;
    applyDebug(cfg);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.client, spdlog::level::debug);
}

TEST_F(ConfigTest, Errors) {
    EXPECT_THROW(loadConfig((dir.path() / "absent.yaml").string()), std::runtime_error);
    EXPECT_THROW(loadConfig(write("- a\n- b\n")), std::runtime_error);
    EXPECT_THROW(loadConfig(write("server: [1, 2]\n")), std::runtime_error);
}

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace ts::config {

constexpr static uintmax_t MAX_REQUEST_BYTES = 1024 * 1024;      // 1MB gzip'd bitmap
constexpr static uintmax_t MAX_BITMAP_BYTES = 16 * 1024 * 1024;  // 16MB, ~134M files

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8090;
    std::filesystem::path archive_root = "/tmp/";
    unsigned int threads = 4;
    std::chrono::seconds io_timeout = std::chrono::seconds(600);
    std::chrono::seconds keep_alive_timeout = std::chrono::seconds(5);  // 0 closes after every response
    int compression_level = 6;
    uintmax_t max_request_bytes = MAX_REQUEST_BYTES;
    uintmax_t max_bitmap_bytes = MAX_BITMAP_BYTES;
};

struct ClientConfig {
    std::filesystem::path temp_dir;  // empty means the system temp dir
    std::chrono::seconds io_timeout = std::chrono::seconds(600);
    int bitmap_compression_level = 9;
    bool preserve_order = true;
    std::string archive_suffix = ".tgz";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum tarsync = spdlog::level::info;   // startup/shutdown, top-level failures
    spdlog::level::level_enum archive = spdlog::level::warn;   // codec and store errors
    spdlog::level::level_enum sync    = spdlog::level::info;   // scan and diff summaries
    spdlog::level::level_enum http    = spdlog::level::info;   // requests and 4xx/5xx
    spdlog::level::level_enum client  = spdlog::level::info;   // sync phases
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty disables the file sink
    LogLevelsConfig levels;
};

struct Config {
    ServerConfig server;
    ClientConfig client;
    LoggingConfig logging;
    bool debug = false;
};

Config loadConfig(const std::string& path);

// Forces every log level down to debug.
void applyDebug(Config& cfg);

}

#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ts::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["archive_root"] = rhs.archive_root.string();
        node["threads"] = rhs.threads;
        node["io_timeout_seconds"] = rhs.io_timeout.count();
        node["keep_alive_timeout_seconds"] = rhs.keep_alive_timeout.count();
        node["compression_level"] = rhs.compression_level;
        node["max_request_bytes_kb"] = rhs.max_request_bytes / 1024;
        node["max_bitmap_bytes_mb"] = rhs.max_bitmap_bytes / (1024 * 1024);
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(8090);
        rhs.archive_root = node["archive_root"].as<std::string>("/tmp/");
        rhs.threads = node["threads"].as<unsigned int>(4);
        rhs.io_timeout = std::chrono::seconds(node["io_timeout_seconds"].as<unsigned int>(600));
        rhs.keep_alive_timeout = std::chrono::seconds(node["keep_alive_timeout_seconds"].as<unsigned int>(5));
        rhs.compression_level = node["compression_level"].as<int>(6);
        rhs.max_request_bytes = node["max_request_bytes_kb"].as<uintmax_t>(1024) * 1024;
        rhs.max_bitmap_bytes = node["max_bitmap_bytes_mb"].as<uintmax_t>(16) * 1024 * 1024;
        return true;
    }
};

template<>
struct convert<ClientConfig> {
    static Node encode(const ClientConfig& rhs) {
        Node node;
        node["temp_dir"] = rhs.temp_dir.string();
        node["io_timeout_seconds"] = rhs.io_timeout.count();
        node["bitmap_compression_level"] = rhs.bitmap_compression_level;
        node["preserve_order"] = rhs.preserve_order;
        node["archive_suffix"] = rhs.archive_suffix;
        return node;
    }

    static bool decode(const Node& node, ClientConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.temp_dir = node["temp_dir"].as<std::string>("");
        rhs.io_timeout = std::chrono::seconds(node["io_timeout_seconds"].as<unsigned int>(600));
        rhs.bitmap_compression_level = node["bitmap_compression_level"].as<int>(9);
        rhs.preserve_order = node["preserve_order"].as<bool>(true);
        rhs.archive_suffix = node["archive_suffix"].as<std::string>(".tgz");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["tarsync"] = to_std_string(spdlog::level::to_string_view(rhs.tarsync));
        node["archive"] = to_std_string(spdlog::level::to_string_view(rhs.archive));
        node["sync"]    = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["http"]    = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["client"]  = to_std_string(spdlog::level::to_string_view(rhs.client));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.tarsync = spdlog::level::from_str(node["tarsync"].as<std::string>("info"));
        rhs.archive = spdlog::level::from_str(node["archive"].as<std::string>("warn"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("info"));
        rhs.client = spdlog::level::from_str(node["client"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}

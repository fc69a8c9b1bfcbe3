#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <algorithm>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace ts::config {

Config loadConfig(const std::string& path) {
    Config cfg;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config " + path + ": " + e.what());
    }

    if (root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a map: " + path);

    try {
        if (auto node = root["server"]) cfg.server = node.as<ServerConfig>();
        if (auto node = root["client"]) cfg.client = node.as<ClientConfig>();
        if (auto node = root["logging"]) cfg.logging = node.as<LoggingConfig>();
        if (auto node = root["debug"]) cfg.debug = node.as<bool>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config " + path + ": " + e.what());
    }

    if (cfg.debug) applyDebug(cfg);
    return cfg;
}

void applyDebug(Config& cfg) {
    cfg.debug = true;

    auto& levels = cfg.logging.levels;
    const auto lower = [](spdlog::level::level_enum& lvl) { lvl = std::min(lvl, spdlog::level::debug); };
    lower(levels.console_log_level);
    lower(levels.file_log_level);
    lower(levels.subsystem_levels.tarsync);
    lower(levels.subsystem_levels.archive);
    lower(levels.subsystem_levels.sync);
    lower(levels.subsystem_levels.http);
    lower(levels.subsystem_levels.client);
}

}

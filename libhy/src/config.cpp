//
// Created by cv2 on 11/8/25.
//

#include "libhy/config.h"
#include "libhy/logging.h"

#include <yaml-cpp/yaml.h>

namespace hy {

    static std::expected<Config, ConfigError> parse_config_node(const YAML::Node& root) {
        Config config;
        if (root.IsNull()) {
            return config; // empty document
        }
        if (!root.IsMap()) {
            log::error("Configuration is not a YAML mapping");
            return std::unexpected(ConfigError::InvalidFormat);
        }

        try {
            if (root["socket_path"]) {
                const auto socket_path = root["socket_path"].as<std::string>();
                if (socket_path.empty()) {
                    log::error("'socket_path' must not be empty");
                    return std::unexpected(ConfigError::InvalidValue);
                }
                config.socket_path = socket_path;
            }

            if (root["default_channel"]) {
                const auto channel = root["default_channel"].as<std::string>();
                if (channel.empty()) {
                    log::error("'default_channel' must not be empty");
                    return std::unexpected(ConfigError::InvalidValue);
                }
                config.default_channel = channel;
            }

            if (root["poll_interval_ms"]) {
                const auto interval = root["poll_interval_ms"].as<long>();
                if (interval <= 0) {
                    log::error("'poll_interval_ms' must be positive, got " + std::to_string(interval));
                    return std::unexpected(ConfigError::InvalidValue);
                }
                config.poll_interval = std::chrono::milliseconds(interval);
            }

            if (root["verbose"]) {
                config.verbose = root["verbose"].as<bool>();
            }
        } catch (const YAML::BadConversion& e) {
            log::error(std::string("Invalid configuration value: ") + e.what());
            return std::unexpected(ConfigError::InvalidValue);
        }
        return config;
    }

    std::expected<Config, ConfigError> Config::load(const std::filesystem::path& file_path) {
        if (!std::filesystem::exists(file_path)) {
            log::debug("No configuration at " + file_path.string() + ", using defaults");
            return Config{};
        }
        try {
            YAML::Node root = YAML::LoadFile(file_path.string());
            return parse_config_node(root);
        } catch (const YAML::Exception& e) {
            log::error("Failed to parse configuration " + file_path.string() + ": " + e.what());
            return std::unexpected(ConfigError::InvalidFormat);
        }
    }

    std::expected<Config, ConfigError> Config::load_from_string(const std::string& content) {
        try {
            YAML::Node root = YAML::Load(content);
            return parse_config_node(root);
        } catch (const YAML::Exception& e) {
            log::error(std::string("Failed to parse configuration from string: ") + e.what());
            return std::unexpected(ConfigError::InvalidFormat);
        }
    }

} // namespace hy

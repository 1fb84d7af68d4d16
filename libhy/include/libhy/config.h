//
// Created by cv2 on 11/8/25.
//

#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>

namespace hy {

    enum class ConfigError {
        InvalidFormat,
        InvalidValue
    };

    struct Config {
        std::filesystem::path socket_path = "/run/snapd.socket";
        std::string default_channel = "latest/stable";
        std::chrono::milliseconds poll_interval{100};
        bool verbose = false;

        // A missing file yields the defaults; every key is optional.
        static std::expected<Config, ConfigError> load(const std::filesystem::path& file_path);

        static std::expected<Config, ConfigError> load_from_string(const std::string& content);
    };

} // namespace hy

//
// distro-detect - Configuration Loading
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_CONFIG_CONFIG_H
#define DISTRO_DETECT_CONFIG_CONFIG_H

#include <distro/linux_distro.h>
#include <output/format.h>

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace distro_detect {

    inline constexpr std::string_view default_config_path = "/etc/distro-detect/config.toml";

    struct DetectConfig {
        std::filesystem::path fs_root{"/"};
    };

    struct OutputConfig {
        OutputFormat format{OutputFormat::text};
        std::vector<DistroField> fields;  // empty = all fields
    };

    //
    // Top-level configuration structure.
    //
    struct Config {
        DetectConfig detect;
        OutputConfig output;
    };

    //
    // Load configuration from a TOML file.
    //
    // Preconditions:
    //   - path must refer to a valid TOML file
    //
    // Postconditions:
    //   - On success: returns parsed and validated Config
    //   - On failure: returns error message describing the failure
    //
    [[nodiscard]] auto load_config(std::filesystem::path const& path)
        -> std::expected<Config, std::string>;

    //
    // Load configuration with defaults for missing values.
    //
    // If the file doesn't exist, returns default configuration.
    // If the file exists but has parse errors, returns error.
    //
    [[nodiscard]] auto load_config_or_default(std::filesystem::path const& path)
        -> std::expected<Config, std::string>;

}  // namespace distro_detect

#endif  // DISTRO_DETECT_CONFIG_CONFIG_H

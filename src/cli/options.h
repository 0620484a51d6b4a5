//
// distro-detect - Command Line Options
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_CLI_OPTIONS_H
#define DISTRO_DETECT_CLI_OPTIONS_H

#include <config/config.h>

#include <expected>
#include <filesystem>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace distro_detect {

    //
    // Options as given on the command line. Unset optionals fall back to
    // the configuration file.
    //
    struct CliOptions {
        bool show_help{false};
        bool show_version{false};
        bool list_detectors{false};
        std::filesystem::path config_path{default_config_path};
        std::optional<std::string> format;
        std::optional<std::string> fields;
        std::optional<std::filesystem::path> fs_root;
    };

    //
    // Parse arguments (argv without the program name).
    //
    // Both "--format json" and "--format=json" are accepted.
    //
    // Postconditions:
    //   - On success: returns the parsed options
    //   - On failure: returns error naming the offending argument
    //
    [[nodiscard]] auto parse_arguments(std::span<char const* const> args)
        -> std::expected<CliOptions, std::string>;

    //
    // Apply command line overrides on top of a loaded configuration.
    //
    [[nodiscard]] auto apply_overrides(Config config, CliOptions const& options)
        -> std::expected<Config, std::string>;

    void print_usage(std::ostream& out, std::string_view program_name);

    void print_version(std::ostream& out);

}  // namespace distro_detect

#endif  // DISTRO_DETECT_CLI_OPTIONS_H

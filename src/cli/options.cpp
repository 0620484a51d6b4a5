//
// distro-detect - Command Line Options Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <cli/options.h>

#include <format>
#include <string_view>
#include <utility>

namespace distro_detect {

    namespace {

        //
        // Split "--name=value" into its parts.
        //
        auto split_inline_value(std::string_view arg)
            -> std::pair<std::string_view, std::optional<std::string_view>> {
            if (!arg.starts_with("--")) {
                return {arg, std::nullopt};
            }
            auto pos = arg.find('=');
            if (pos == std::string_view::npos) {
                return {arg, std::nullopt};
            }
            return {arg.substr(0, pos), arg.substr(pos + 1)};
        }

    }  // anonymous namespace

    auto parse_arguments(std::span<char const* const> args)
        -> std::expected<CliOptions, std::string> {

        CliOptions options;

        for (std::size_t i = 0; i < args.size(); ++i) {
            auto [name, inline_value] = split_inline_value(args[i]);

            auto take_value = [&]() -> std::expected<std::string, std::string> {
                if (inline_value) {
                    return std::string{*inline_value};
                }
                if (i + 1 < args.size()) {
                    return std::string{args[++i]};
                }
                return std::unexpected(std::format("{} requires an argument", name));
            };

            if (name == "-h" || name == "--help") {
                options.show_help = true;
            } else if (name == "-v" || name == "--version") {
                options.show_version = true;
            } else if (name == "-l" || name == "--list-detectors") {
                options.list_detectors = true;
            } else if (name == "-c" || name == "--config") {
                auto value = take_value();
                if (!value) return std::unexpected(value.error());
                options.config_path = *value;
            } else if (name == "-f" || name == "--format") {
                auto value = take_value();
                if (!value) return std::unexpected(value.error());
                options.format = *value;
            } else if (name == "-F" || name == "--fields") {
                auto value = take_value();
                if (!value) return std::unexpected(value.error());
                options.fields = *value;
            } else if (name == "-r" || name == "--fsroot") {
                auto value = take_value();
                if (!value) return std::unexpected(value.error());
                options.fs_root = std::filesystem::path{*value};
            } else {
                return std::unexpected(std::format("Unknown option: {}", args[i]));
            }
        }

        return options;
    }

    auto apply_overrides(Config config, CliOptions const& options)
        -> std::expected<Config, std::string> {

        if (options.format) {
            auto format = string_to_format(*options.format);
            if (!format) {
                return std::unexpected(format.error());
            }
            config.output.format = *format;
        }

        if (options.fields) {
            auto fields = parse_field_list(*options.fields);
            if (!fields) {
                return std::unexpected(fields.error());
            }
            config.output.fields = std::move(*fields);
        }

        if (options.fs_root) {
            if (options.fs_root->empty()) {
                return std::unexpected(std::string{"--fsroot requires a non-empty path"});
            }
            config.detect.fs_root = *options.fs_root;
        }

        return config;
    }

    void print_usage(std::ostream& out, std::string_view program_name) {
        out << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Detect the Linux distribution of a filesystem tree.\n"
            << "\n"
            << "Options:\n"
            << "  -f, --format FORMAT  Output format: text, text-no-labels, json,\n"
            << "                       json-one-line (default: text)\n"
            << "  -F, --fields LIST    Fields to output (comma separated): id, name,\n"
            << "                       version, lsb_release, os_release\n"
            << "  -r, --fsroot PATH    Root of the filesystem to inspect (default: /)\n"
            << "  -c, --config PATH    Path to configuration file\n"
            << "                       (default: " << default_config_path << ")\n"
            << "  -l, --list-detectors List detectors in evaluation order\n"
            << "  -h, --help           Show this help message\n"
            << "  -v, --version        Show version information\n"
            << "\n";
    }

    void print_version(std::ostream& out) {
        out << "distro-detect 0.1.0\n"
            << "Copyright (c) 2026 Tony Walker\n"
            << "License: GPL-3.0-or-later\n";
    }

}  // namespace distro_detect

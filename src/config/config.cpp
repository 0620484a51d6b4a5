//
// distro-detect - Configuration Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <config/config.h>

#include <hinder/exception/exception.h>

#include <toml++/toml.hpp>

#include <format>

namespace distro_detect {

    HINDER_DEFINE_EXCEPTION(config_error, hinder::generic_error);

    namespace {

        //
        // Extract optional value from TOML table with default.
        //
        template<typename T>
        auto get_or(toml::table const& table, std::string_view key, T default_value) -> T {
            if (auto opt = table[key].value<T>()) {
                return *opt;
            }
            return default_value;
        }

        //
        // Parse DetectConfig section.
        //
        auto parse_detect(toml::table const& root) -> DetectConfig {
            DetectConfig cfg;

            if (auto detect = root["detect"].as_table()) {
                cfg.fs_root = get_or(*detect, "fs_root", cfg.fs_root.string());
                HINDER_EXPECTS(!cfg.fs_root.empty(), config_error)
                    .message("detect.fs_root must not be empty");
            }

            return cfg;
        }

        //
        // Parse the output field list; every entry must name a known field.
        //
        auto parse_fields(toml::array const* arr) -> std::vector<DistroField> {
            std::vector<DistroField> fields;
            if (!arr) return fields;

            for (auto const& elem : *arr) {
                auto str = elem.value<std::string>();
                HINDER_EXPECTS(str.has_value(), config_error)
                    .message("output.fields entries must be strings");

                auto field = string_to_field(*str);
                HINDER_EXPECTS(field.has_value(), config_error)
                    .message("Invalid output field: {}", *str);
                fields.push_back(*field);
            }
            return fields;
        }

        //
        // Parse OutputConfig section.
        //
        auto parse_output(toml::table const& root) -> OutputConfig {
            OutputConfig cfg;

            if (auto output = root["output"].as_table()) {
                auto format_str = get_or(*output, "format",
                                         std::string{format_to_string(cfg.format)});
                auto format = string_to_format(format_str);
                HINDER_EXPECTS(format.has_value(), config_error)
                    .message("Invalid output format: {}", format_str);
                cfg.format = *format;

                cfg.fields = parse_fields((*output)["fields"].as_array());
            }

            return cfg;
        }

    }  // anonymous namespace

    auto load_config(std::filesystem::path const& path)
        -> std::expected<Config, std::string> {

        try {
            auto toml = toml::parse_file(path.string());

            Config cfg;
            cfg.detect = parse_detect(toml);
            cfg.output = parse_output(toml);

            return cfg;
        }
        catch (toml::parse_error const& e) {
            return std::unexpected(std::format("TOML parse error: {}", e.description()));
        }
        catch (config_error const& e) {
            return std::unexpected(std::format("Config error: {}", e.what()));
        }
        catch (std::exception const& e) {
            return std::unexpected(std::format("Unexpected error loading config: {}", e.what()));
        }
    }

    auto load_config_or_default(std::filesystem::path const& path)
        -> std::expected<Config, std::string> {

        if (!std::filesystem::exists(path)) {
            // Return default configuration
            return Config{};
        }

        return load_config(path);
    }

}  // namespace distro_detect

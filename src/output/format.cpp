//
// distro-detect - Result Presentation Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <output/format.h>

#include <output/json.h>

#include <format>
#include <ranges>
#include <vector>

namespace distro_detect {

    namespace {

        auto check_stream(std::ostream const& out) -> std::expected<void, std::string> {
            if (!out) {
                return std::unexpected(std::string{"Failed to write output"});
            }
            return {};
        }

        auto write_line(std::ostream& out, std::string_view label, std::string_view value,
                        bool labels) -> void {
            if (labels) {
                out << label << ": ";
            }
            out << value << '\n';
        }

    }  // anonymous namespace

    auto format_to_string(OutputFormat format) -> std::string_view {
        switch (format) {
            case OutputFormat::text:
                return "text";
            case OutputFormat::text_no_labels:
                return "text-no-labels";
            case OutputFormat::json:
                return "json";
            case OutputFormat::json_one_line:
                return "json-one-line";
        }
        return "unknown";
    }

    auto string_to_format(std::string_view str) -> std::expected<OutputFormat, std::string> {
        if (str == "text") {
            return OutputFormat::text;
        }
        if (str == "text-no-labels") {
            return OutputFormat::text_no_labels;
        }
        if (str == "json") {
            return OutputFormat::json;
        }
        if (str == "json-one-line") {
            return OutputFormat::json_one_line;
        }
        return std::unexpected(std::format("Unknown output format: {}", str));
    }

    auto parse_field_list(std::string_view list)
        -> std::expected<std::vector<DistroField>, std::string> {

        std::vector<DistroField> fields;
        for (auto const part : std::views::split(list, ',')) {
            std::string_view entry{part.begin(), part.end()};
            if (entry.find_first_not_of(" \t") == std::string_view::npos) {
                continue;
            }
            auto field = string_to_field(entry);
            if (!field) {
                return std::unexpected(field.error());
            }
            fields.push_back(*field);
        }
        return fields;
    }

    auto write_result(std::ostream& out, LinuxDistro const& distro, DistroField field, bool labels)
        -> std::expected<void, std::string> {

        if (!is_map_field(field)) {
            write_line(out, display_label(field), scalar_value(distro, field), labels);
            return check_stream(out);
        }

        for (auto const& [key, value] : map_value(distro, field)) {
            write_line(out, std::format("{} {}", display_label(field), key), value, labels);
        }
        return check_stream(out);
    }

    auto write_results(std::ostream& out, LinuxDistro const& distro, OutputFormat format,
                       std::span<DistroField const> fields) -> std::expected<void, std::string> {

        if (format == OutputFormat::json || format == OutputFormat::json_one_line) {
            out << output::json::to_json(distro, format == OutputFormat::json) << '\n';
            return check_stream(out);
        }

        bool const labels = format == OutputFormat::text;
        std::span<DistroField const> const selected = fields.empty()
            ? std::span<DistroField const>{all_fields}
            : fields;

        for (auto field : selected) {
            if (auto result = write_result(out, distro, field, labels); !result) {
                return result;
            }
        }
        return check_stream(out);
    }

}  // namespace distro_detect

//
// distro-detect - Result Presentation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_OUTPUT_FORMAT_H
#define DISTRO_DETECT_OUTPUT_FORMAT_H

#include <distro/linux_distro.h>

#include <cstdint>
#include <expected>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace distro_detect {

    //
    // Output formats understood by the command line tool.
    //
    enum class OutputFormat : std::uint8_t {
        text,           // "Distro ID: centos"
        text_no_labels, // "centos"
        json,           // Pretty printed, two space indent
        json_one_line   // Compact
    };

    [[nodiscard]] auto format_to_string(OutputFormat format) -> std::string_view;

    [[nodiscard]] auto string_to_format(std::string_view str)
        -> std::expected<OutputFormat, std::string>;

    //
    // Parse a comma separated field list ("id, Version").
    //
    // Postconditions:
    //   - Entries are trimmed and matched case-insensitively
    //   - Empty entries are skipped; an empty list means all fields
    //   - Any unknown entry fails the whole parse
    //
    [[nodiscard]] auto parse_field_list(std::string_view list)
        -> std::expected<std::vector<DistroField>, std::string>;

    //
    // Write a single field as text.
    //
    // Scalars produce "<label>: <value>\n". Map fields produce one line per
    // property, "<label> <KEY>: <value>\n", in key order. With labels
    // disabled only the value is written.
    //
    [[nodiscard]] auto write_result(std::ostream& out, LinuxDistro const& distro,
                                    DistroField field, bool labels)
        -> std::expected<void, std::string>;

    //
    // Write the record in the given format.
    //
    // Text formats honor the field selection (empty = all fields, in
    // canonical order). JSON formats always carry the full record.
    //
    // Postconditions:
    //   - On success: output ends with a newline
    //   - On failure: returns error describing the stream failure
    //
    [[nodiscard]] auto write_results(std::ostream& out, LinuxDistro const& distro,
                                     OutputFormat format, std::span<DistroField const> fields)
        -> std::expected<void, std::string>;

}  // namespace distro_detect

#endif  // DISTRO_DETECT_OUTPUT_FORMAT_H

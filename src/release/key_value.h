//
// distro-detect - KEY=VALUE Release File Parsing
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_RELEASE_KEY_VALUE_H
#define DISTRO_DETECT_RELEASE_KEY_VALUE_H

#include <core/types.h>

#include <expected>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace distro_detect {

    //
    // Split a single KEY=VALUE line.
    //
    // Whitespace around the key and the value is tolerated and the value may
    // contain spaces. Trailing whitespace is trimmed from the value, then one
    // pair of enclosing double quotes is removed.
    //
    // Returns nullopt for blank lines, comment lines (first character '#')
    // and lines without a KEY=VALUE shape.
    //
    // Example:
    //   split_key_value("   NAME\t =  \"Fedora Linux\"\r")  -> {"NAME", "Fedora Linux"}
    //
    [[nodiscard]] auto split_key_value(std::string_view line)
        -> std::optional<std::pair<std::string, std::string>>;

    //
    // Parse an os-release / lsb-release style stream.
    //
    // Malformed lines are skipped. If the same key appears more than once the
    // last occurrence wins.
    //
    // Postconditions:
    //   - On success: returns parsed properties (possibly empty)
    //   - On failure: returns error message if the stream could not be read
    //
    [[nodiscard]] auto parse_properties(std::istream& input)
        -> std::expected<PropertyMap, std::string>;

    //
    // Parse in-memory KEY=VALUE text.
    //
    // Never fails; malformed lines are skipped.
    //
    [[nodiscard]] auto parse_properties(std::string_view contents) -> PropertyMap;

}  // namespace distro_detect

#endif  // DISTRO_DETECT_RELEASE_KEY_VALUE_H

//
// distro-detect - Legacy "release" Line Parsing
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_RELEASE_RELEASE_LINE_H
#define DISTRO_DETECT_RELEASE_RELEASE_LINE_H

#include <optional>
#include <string>
#include <string_view>

namespace distro_detect {

    //
    // Parse a Red Hat style release line and extract the version.
    //
    // Matches "<DistroName> [release|version] <version> [extra]" at the start
    // of contents, e.g. "CentOS Linux release 7.8.2003 (Core)" or
    // "Gentoo Base System version 1.6.14".
    //
    // Postconditions:
    //   - Returns the trimmed version ("unknown" if the version is empty) when
    //     the line has the expected shape and starts with expected_prefix
    //   - Returns nullopt when the prefix differs or the shape does not match
    //
    [[nodiscard]] auto parse_release_line(std::string_view contents,
                                          std::string_view expected_prefix)
        -> std::optional<std::string>;

}  // namespace distro_detect

#endif  // DISTRO_DETECT_RELEASE_RELEASE_LINE_H

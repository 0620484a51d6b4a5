//
// distro-detect - BusyBox Version Banner Scanning
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_RELEASE_BUSYBOX_SCANNER_H
#define DISTRO_DETECT_RELEASE_BUSYBOX_SCANNER_H

#include <cstddef>
#include <expected>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace distro_detect {

    // Banner embedded in every BusyBox binary, followed by the version digits
    inline constexpr std::string_view busybox_signature = "BusyBox v";

    // Shortest digit/dot run accepted as a version ("1.32.0")
    inline constexpr std::size_t busybox_min_version_length = 6;

    //
    // Incremental matcher for the BusyBox version banner.
    //
    // Bytes are fed in arbitrary chunks; state carries across chunk
    // boundaries. After the signature, digits and dots accumulate as the
    // version. A disqualifying byte ends the match if at least
    // busybox_min_version_length characters were collected, otherwise the
    // matcher resets and keeps looking.
    //
    class BusyBoxBannerMatcher {
    public:
        //
        // Feed a chunk. Returns true once a complete version has been found;
        // later chunks are ignored.
        //
        auto feed(std::string_view chunk) -> bool;

        //
        // Signal end of input. A version still being collected is accepted
        // if it is long enough.
        //
        auto finish() -> bool;

        [[nodiscard]] auto found() const -> bool { return m_found; }

        //
        // Version as reported to users: "v" + digits and dots.
        //
        [[nodiscard]] auto version() const -> std::string { return "v" + m_version; }

    private:
        auto reset() -> void;

        std::size_t m_matched{0};
        bool m_in_version{false};
        bool m_found{false};
        std::string m_version;
    };

    //
    // Scan a binary stream for the BusyBox version banner.
    //
    // Postconditions:
    //   - On success: returns "v<version>" if the banner was found, nullopt
    //     if the stream ended without one
    //   - On failure: returns error message if the stream could not be read
    //
    [[nodiscard]] auto scan_busybox_version(std::istream& input)
        -> std::expected<std::optional<std::string>, std::string>;

}  // namespace distro_detect

#endif  // DISTRO_DETECT_RELEASE_BUSYBOX_SCANNER_H

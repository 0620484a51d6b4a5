//
// distro-detect - BusyBox Version Banner Scanning Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <release/busybox_scanner.h>

#include <array>

namespace distro_detect {

    namespace {

        // Buffer size for binary reading (64 KiB)
        constexpr std::size_t BUFFER_SIZE = 64 * 1024;

        auto is_version_char(char c) -> bool {
            return (c >= '0' && c <= '9') || c == '.';
        }

        using FailureTable = std::array<std::size_t, busybox_signature.size()>;

        //
        // KMP failure table: entry i is the length of the longest proper
        // prefix of the signature that is also a suffix of its first i + 1
        // characters. Handles restarts such as "BusyBusyBox v".
        //
        constexpr auto build_failure_table() -> FailureTable {
            FailureTable table{};
            std::size_t k = 0;
            for (std::size_t i = 1; i < busybox_signature.size(); ++i) {
                while (k > 0 && busybox_signature[i] != busybox_signature[k]) {
                    k = table[k - 1];
                }
                if (busybox_signature[i] == busybox_signature[k]) {
                    ++k;
                }
                table[i] = k;
            }
            return table;
        }

        constexpr FailureTable failure_table = build_failure_table();

    }  // anonymous namespace

    auto BusyBoxBannerMatcher::reset() -> void {
        m_matched = 0;
        m_in_version = false;
        m_version.clear();
    }

    auto BusyBoxBannerMatcher::feed(std::string_view chunk) -> bool {
        if (m_found) {
            return true;
        }

        for (char const c : chunk) {
            if (m_in_version) {
                if (is_version_char(c)) {
                    m_version += c;
                    continue;
                }
                if (m_version.size() >= busybox_min_version_length) {
                    m_found = true;
                    return true;
                }
                // Too short to be a version; this byte may start a new banner
                reset();
            }

            while (m_matched > 0 && c != busybox_signature[m_matched]) {
                m_matched = failure_table[m_matched - 1];
            }
            if (c == busybox_signature[m_matched]) {
                ++m_matched;
            }

            if (m_matched == busybox_signature.size()) {
                m_in_version = true;
                m_version.clear();
            }
        }

        return false;
    }

    auto BusyBoxBannerMatcher::finish() -> bool {
        if (!m_found && m_in_version && m_version.size() >= busybox_min_version_length) {
            m_found = true;
        }
        return m_found;
    }

    auto scan_busybox_version(std::istream& input)
        -> std::expected<std::optional<std::string>, std::string> {

        BusyBoxBannerMatcher matcher;
        std::array<char, BUFFER_SIZE> buffer{};

        while (input) {
            input.read(buffer.data(), buffer.size());
            auto bytes_read = static_cast<std::size_t>(input.gcount());
            if (bytes_read > 0 && matcher.feed(std::string_view{buffer.data(), bytes_read})) {
                return matcher.version();
            }
        }

        if (input.bad()) {
            return std::unexpected("I/O error while scanning for BusyBox banner");
        }

        if (matcher.finish()) {
            return matcher.version();
        }
        return std::nullopt;
    }

}  // namespace distro_detect

//
// distro-detect - Legacy "release" Line Parsing Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <release/release_line.h>

#include <core/types.h>

#include <regex>

namespace distro_detect {

    namespace {

        auto release_pattern() -> std::regex const& {
            static std::regex const pattern{R"(^(.+) (release|version)? (\S+)\s*(\S+)?)"};
            return pattern;
        }

        auto trim(std::string_view value) -> std::string_view {
            auto const whitespace = std::string_view{" \t\r\n\f\v"};
            auto begin = value.find_first_not_of(whitespace);
            if (begin == std::string_view::npos) {
                return {};
            }
            auto end = value.find_last_not_of(whitespace);
            return value.substr(begin, end - begin + 1);
        }

    }  // anonymous namespace

    auto parse_release_line(std::string_view contents, std::string_view expected_prefix)
        -> std::optional<std::string> {

        std::match_results<std::string_view::const_iterator> match;
        if (!std::regex_search(contents.begin(), contents.end(), match, release_pattern())) {
            return std::nullopt;
        }

        if (!match[0].str().starts_with(expected_prefix)) {
            return std::nullopt;
        }

        auto version = trim(std::string_view{match[3].first, match[3].second});
        if (version.empty()) {
            return std::string{unknown_value};
        }
        return std::string{version};
    }

}  // namespace distro_detect

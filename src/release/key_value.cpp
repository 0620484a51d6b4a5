//
// distro-detect - KEY=VALUE Release File Parsing Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <release/key_value.h>

#include <regex>
#include <sstream>

namespace distro_detect {

    namespace {

        //
        // KEY=VALUE splitter. The value may contain spaces but stops at other
        // whitespace (tabs, carriage returns).
        //
        auto key_value_pattern() -> std::regex const& {
            static std::regex const pattern{R"(^\s*(\S+)\s*=\s*([\S ]+)\s*)"};
            return pattern;
        }

        auto trim_trailing_whitespace(std::string value) -> std::string {
            auto end = value.find_last_not_of(" \t\r\n\f\v");
            if (end == std::string::npos) {
                return {};
            }
            value.erase(end + 1);
            return value;
        }

    }  // anonymous namespace

    auto split_key_value(std::string_view line)
        -> std::optional<std::pair<std::string, std::string>> {

        if (line.empty() || line.front() == '#') {
            return std::nullopt;
        }

        std::match_results<std::string_view::const_iterator> match;
        if (!std::regex_search(line.begin(), line.end(), match, key_value_pattern())) {
            return std::nullopt;
        }

        std::string key = match[1].str();
        std::string value = trim_trailing_whitespace(match[2].str());

        // Remove one layer of enclosing quotes
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        return std::pair{std::move(key), std::move(value)};
    }

    auto parse_properties(std::istream& input) -> std::expected<PropertyMap, std::string> {
        PropertyMap properties;

        std::string line;
        while (std::getline(input, line)) {
            if (auto kv = split_key_value(line)) {
                properties[kv->first] = std::move(kv->second);
            }
        }

        if (input.bad()) {
            return std::unexpected("I/O error while reading properties");
        }

        return properties;
    }

    auto parse_properties(std::string_view contents) -> PropertyMap {
        std::istringstream input{std::string{contents}};
        auto result = parse_properties(input);
        return result ? std::move(*result) : PropertyMap{};
    }

}  // namespace distro_detect

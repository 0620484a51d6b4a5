//
// distro-detect - Best Guess for Unrecognized Distributions Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <distro/fallback.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace distro_detect {

    namespace {

        auto first_word(std::string const& value) -> std::string {
            std::istringstream words{value};
            std::string word;
            words >> word;
            return word;
        }

        auto to_lower(std::string value) -> std::string {
            std::ranges::transform(value, value.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        //
        // First non-empty candidate, or fallback.
        //
        auto first_of(std::initializer_list<std::string> candidates, std::string_view fallback)
            -> std::string {
            for (auto const& candidate : candidates) {
                if (!candidate.empty()) {
                    return candidate;
                }
            }
            return std::string{fallback};
        }

    }  // anonymous namespace

    auto best_guess(PropertyMap const& lsb_properties, PropertyMap const& os_properties)
        -> LinuxDistro {

        auto os_id = get_property(os_properties, "ID");
        auto lsb_id = get_property(lsb_properties, "DISTRIB_ID");

        return LinuxDistro{
            .name = first_of({get_property(os_properties, "NAME"),
                              first_word(get_property(os_properties, "PRETTY_NAME")),
                              lsb_id,
                              os_id},
                             "Unknown"),
            .id = first_of({os_id, to_lower(lsb_id)}, unknown_value),
            .version = first_of({get_property(os_properties, "VERSION_ID"),
                                 get_property(lsb_properties, "DISTRIB_RELEASE"),
                                 first_word(get_property(os_properties, "VERSION"))},
                                unknown_value),
            .lsb_properties = lsb_properties,
            .os_properties = os_properties,
        };
    }

}  // namespace distro_detect

//
// distro-detect - Core Types
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_CORE_TYPES_H
#define DISTRO_DETECT_CORE_TYPES_H

#include <compare>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace distro_detect {

    //
    // Strong type wrapper using CRTP for zero-cost abstraction.
    // Prevents accidental mixing of semantically different types.
    //
    // Example:
    //   using FilePath = StrongType<struct FilePathTag, std::filesystem::path>;
    //   FilePath path{"/etc/os-release"};
    //
    template<typename Tag, typename T>
    struct StrongType {
        T value;

        constexpr StrongType() = default;
        explicit constexpr StrongType(T v) : value(std::move(v)) {}

        // Allow implicit conversion back to underlying type when needed
        [[nodiscard]] constexpr auto operator*() const -> T const& { return value; }
        [[nodiscard]] constexpr auto operator*() -> T& { return value; }

        // Comparison operators
        auto operator<=>(StrongType const&) const = default;
    };

    //
    // Domain-specific strong types
    //

    // Fully resolved path on the host (root prefix already applied)
    using FilePath = StrongType<struct FilePathTag, std::filesystem::path>;

    //
    // Properties parsed from a KEY=VALUE release file.
    //
    // Keys are unique. std::map keeps iteration (and therefore output) stable.
    //
    using PropertyMap = std::map<std::string, std::string>;

    // Placeholder for a version or identity that could not be determined
    inline constexpr std::string_view unknown_value = "unknown";

    //
    // Look up a property, returning an empty string if it is absent.
    //
    // A missing key and a key with an empty value are treated the same.
    //
    [[nodiscard]] inline auto get_property(PropertyMap const& props, std::string const& key)
        -> std::string {
        auto it = props.find(key);
        return it != props.end() ? it->second : std::string{};
    }

}  // namespace distro_detect

#endif  // DISTRO_DETECT_CORE_TYPES_H

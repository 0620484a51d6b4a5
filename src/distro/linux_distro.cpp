//
// distro-detect - Detected Distribution Record Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <distro/linux_distro.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <sstream>

namespace distro_detect {

    namespace {

        constexpr std::array<std::string_view, 5> redhat_family_ids{
            "centos", "fedora", "ol", "rhel", "scientific"};

        constexpr std::array<std::string_view, 4> rhel_family_ids{
            "centos", "ol", "rhel", "scientific"};

        //
        // Check the space separated ID_LIKE list for any of the given ids.
        //
        auto id_like_contains(PropertyMap const& os_properties,
                              std::initializer_list<std::string_view> wanted) -> bool {
            std::istringstream id_like{get_property(os_properties, "ID_LIKE")};
            std::string id;
            while (id_like >> id) {
                if (std::ranges::find(wanted, std::string_view{id}) != wanted.end()) {
                    return true;
                }
            }
            return false;
        }

        auto empty_string() -> std::string const& {
            static std::string const empty;
            return empty;
        }

        auto empty_map() -> PropertyMap const& {
            static PropertyMap const empty;
            return empty;
        }

    }  // anonymous namespace

    auto LinuxDistro::is_redhat_family() const -> bool {
        if (std::ranges::find(redhat_family_ids, std::string_view{id}) != redhat_family_ids.end()) {
            return true;
        }
        return id_like_contains(os_properties, {"rhel", "fedora"});
    }

    auto LinuxDistro::is_rhel_family() const -> bool {
        if (std::ranges::find(rhel_family_ids, std::string_view{id}) != rhel_family_ids.end()) {
            return true;
        }
        return id_like_contains(os_properties, {"rhel"});
    }

    auto LinuxDistro::uses_rpm() const -> bool {
        return is_redhat_family() || id == "opensuse" || id == "sles";
    }

    auto field_key(DistroField field) -> std::string_view {
        switch (field) {
            case DistroField::id:
                return "id";
            case DistroField::name:
                return "name";
            case DistroField::version:
                return "version";
            case DistroField::lsb_release:
                return "lsb_release";
            case DistroField::os_release:
                return "os_release";
        }
        return "unknown";
    }

    auto display_label(DistroField field) -> std::string_view {
        switch (field) {
            case DistroField::id:
                return "Distro ID";
            case DistroField::name:
                return "Distro Name";
            case DistroField::version:
                return "Distro Version";
            case DistroField::lsb_release:
                return "Distro LSB";
            case DistroField::os_release:
                return "Distro OS";
        }
        return "Distro";
    }

    auto is_map_field(DistroField field) -> bool {
        return field == DistroField::lsb_release || field == DistroField::os_release;
    }

    auto scalar_value(LinuxDistro const& distro, DistroField field) -> std::string const& {
        switch (field) {
            case DistroField::id:
                return distro.id;
            case DistroField::name:
                return distro.name;
            case DistroField::version:
                return distro.version;
            case DistroField::lsb_release:
            case DistroField::os_release:
                break;
        }
        return empty_string();
    }

    auto map_value(LinuxDistro const& distro, DistroField field) -> PropertyMap const& {
        if (field == DistroField::lsb_release) {
            return distro.lsb_properties;
        }
        if (field == DistroField::os_release) {
            return distro.os_properties;
        }
        return empty_map();
    }

    auto string_to_field(std::string_view str) -> std::expected<DistroField, std::string> {
        auto const whitespace = std::string_view{" \t\r\n"};
        auto begin = str.find_first_not_of(whitespace);
        auto end = str.find_last_not_of(whitespace);
        std::string key;
        if (begin != std::string_view::npos) {
            key = str.substr(begin, end - begin + 1);
        }
        std::ranges::transform(key, key.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        for (auto const field : all_fields) {
            if (field_key(field) == key) {
                return field;
            }
        }
        return std::unexpected(std::format("Unknown field: {}", str));
    }

}  // namespace distro_detect

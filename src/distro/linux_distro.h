//
// distro-detect - Detected Distribution Record
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_DISTRO_LINUX_DISTRO_H
#define DISTRO_DETECT_DISTRO_LINUX_DISTRO_H

#include <core/types.h>

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace distro_detect {

    //
    // Distribution identification information.
    //
    struct LinuxDistro {
        std::string name;           // Display name (e.g., "CentOS Linux")
        std::string id;             // Lowercase identifier (e.g., "centos")
        std::string version;        // Version string or "unknown"
        PropertyMap lsb_properties; // Contents of /etc/lsb-release (empty if absent)
        PropertyMap os_properties;  // Contents of os-release (empty if absent)

        auto operator==(LinuxDistro const&) const -> bool = default;

        //
        // Red Hat lineage: centos, fedora, ol, rhel, scientific, or an
        // os-release ID_LIKE naming rhel or fedora.
        //
        [[nodiscard]] auto is_redhat_family() const -> bool;

        //
        // RHEL compatible: centos, ol, rhel, scientific, or ID_LIKE naming rhel.
        //
        [[nodiscard]] auto is_rhel_family() const -> bool;

        //
        // Uses RPM packages: Red Hat lineage plus opensuse and sles.
        //
        [[nodiscard]] auto uses_rpm() const -> bool;
    };

    //
    // Fields of a LinuxDistro exposed to the presentation layer.
    //
    enum class DistroField : std::uint8_t {
        id,
        name,
        version,
        lsb_release,
        os_release
    };

    //
    // All fields in output order.
    //
    inline constexpr std::array<DistroField, 5> all_fields{
        DistroField::id,
        DistroField::name,
        DistroField::version,
        DistroField::lsb_release,
        DistroField::os_release,
    };

    //
    // Field key as used on the command line and in JSON ("lsb_release").
    //
    [[nodiscard]] auto field_key(DistroField field) -> std::string_view;

    //
    // Human readable label ("Distro LSB").
    //
    [[nodiscard]] auto display_label(DistroField field) -> std::string_view;

    //
    // True for fields holding a property map rather than a scalar.
    //
    [[nodiscard]] auto is_map_field(DistroField field) -> bool;

    //
    // Scalar value of a field; empty for map fields.
    //
    [[nodiscard]] auto scalar_value(LinuxDistro const& distro, DistroField field) -> std::string const&;

    //
    // Property map of a map field; empty for scalar fields.
    //
    [[nodiscard]] auto map_value(LinuxDistro const& distro, DistroField field) -> PropertyMap const&;

    //
    // Parse a field key. Surrounding whitespace and case are ignored.
    //
    [[nodiscard]] auto string_to_field(std::string_view str)
        -> std::expected<DistroField, std::string>;

}  // namespace distro_detect

#endif  // DISTRO_DETECT_DISTRO_LINUX_DISTRO_H

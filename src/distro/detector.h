//
// distro-detect - Distribution Detector Registry
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_DISTRO_DETECTOR_H
#define DISTRO_DETECT_DISTRO_DETECTOR_H

#include <core/types.h>
#include <distro/linux_distro.h>
#include <fs/file_resolver.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace distro_detect {

    // Top-level release files, before root prefixing
    inline constexpr std::string_view lsb_release_path = "/etc/lsb-release";
    inline constexpr std::string_view os_release_path = "/etc/os-release";
    inline constexpr std::string_view os_release_fallback_path = "/usr/lib/os-release";

    //
    // Inputs shared by every detector during one classification pass.
    //
    // The property maps are read once by the classifier and never modified.
    // Detectors needing marker files read them through files.
    //
    struct DetectionContext {
        PropertyMap const& lsb_properties;
        PropertyMap const& os_properties;
        FileResolver const& files;
    };

    //
    // A detector returns a fully populated record on a match, nullopt otherwise.
    //
    using DetectFunction = auto (*)(DetectionContext const&) -> std::optional<LinuxDistro>;

    //
    // Named detector entry.
    //
    struct DistroDetector {
        std::string_view name;
        DetectFunction detect;
    };

    //
    // Detectors in precedence order.
    //
    // The order matters: CentOS and RHEL are tried before the generic Red Hat
    // readers, and BusyBox comes last because its heuristic would claim any
    // minimal system lacking a release file.
    //
    [[nodiscard]] auto default_detectors() -> std::vector<DistroDetector> const&;

    //
    // Names of the given detectors, in order.
    //
    [[nodiscard]] auto detector_names(std::vector<DistroDetector> const& detectors)
        -> std::vector<std::string>;

}  // namespace distro_detect

#endif  // DISTRO_DETECT_DISTRO_DETECTOR_H

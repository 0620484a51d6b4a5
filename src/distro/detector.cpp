//
// distro-detect - Distribution Detector Registry Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <distro/detector.h>

#include <distro/checks.h>

namespace distro_detect {

    auto default_detectors() -> std::vector<DistroDetector> const& {
        static std::vector<DistroDetector> const detectors{
            {"centos", detect_centos},
            {"rhel", detect_rhel},
            {"ubuntu", detect_ubuntu},
            {"debian", detect_debian},
            {"amazon-linux", detect_amazon_linux},
            {"fedora", detect_fedora},
            {"opensuse", detect_opensuse},
            {"sles", detect_sles},
            {"oracle-linux", detect_oracle_linux},
            {"photon", detect_photon},
            {"alpine", detect_alpine},
            {"arch", detect_arch_linux},
            {"gentoo", detect_gentoo},
            {"kali", detect_kali},
            {"scientific", detect_scientific_linux},
            {"slackware", detect_slackware},
            {"mageia", detect_mageia},
            {"clear-linux", detect_clear_linux},
            {"mint", detect_mint},
            {"mx", detect_mx_linux},
            {"novell-oes", detect_novell_oes},
            {"puppy", detect_puppy},
            {"rancheros", detect_rancher_os},
            {"alt", detect_alt},
            {"nixos", detect_nixos},
            {"crux", detect_crux},
            {"source-mage", detect_source_mage},
            {"android", detect_android},
            {"yellow-dog", detect_yellow_dog},
            // Must stay last, see detect_busybox()
            {"busybox", detect_busybox},
        };
        return detectors;
    }

    auto detector_names(std::vector<DistroDetector> const& detectors) -> std::vector<std::string> {
        std::vector<std::string> names;
        names.reserve(detectors.size());
        for (auto const& detector : detectors) {
            names.emplace_back(detector.name);
        }
        return names;
    }

}  // namespace distro_detect

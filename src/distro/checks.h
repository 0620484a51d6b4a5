//
// distro-detect - Per-Distribution Checks
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_DISTRO_CHECKS_H
#define DISTRO_DETECT_DISTRO_CHECKS_H

#include <distro/detector.h>

#include <optional>

namespace distro_detect {

    //
    // One check per supported distribution.
    //
    // Each returns the detected record, or nullopt if the system is not that
    // distribution. Checks only read files through ctx.files and never fail:
    // missing or unreadable files simply mean "no match".
    //
    // Red Hat lineage checks (CentOS, RHEL, Fedora, Scientific Linux) call
    // detect_oracle_linux() first, because Oracle Linux ships Red Hat text in
    // /etc/redhat-release. detect_debian() calls detect_mx_linux() first for
    // the same reason.
    //

    [[nodiscard]] auto detect_alpine(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_alt(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_amazon_linux(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_android(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_arch_linux(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_centos(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_clear_linux(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_crux(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_debian(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_fedora(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_gentoo(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_kali(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_mageia(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_mint(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_mx_linux(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_nixos(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_novell_oes(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_opensuse(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_oracle_linux(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_photon(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_puppy(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_rancher_os(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_rhel(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_scientific_linux(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_slackware(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_sles(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_source_mage(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_ubuntu(DetectionContext const& ctx) -> std::optional<LinuxDistro>;
    [[nodiscard]] auto detect_yellow_dog(DetectionContext const& ctx) -> std::optional<LinuxDistro>;

    //
    // BusyBox is not a distribution but a multi-call userland. Only reported
    // when no lsb-release or os-release file exists and /bin/true carries the
    // BusyBox version banner.
    //
    [[nodiscard]] auto detect_busybox(DetectionContext const& ctx) -> std::optional<LinuxDistro>;

}  // namespace distro_detect

#endif  // DISTRO_DETECT_DISTRO_CHECKS_H

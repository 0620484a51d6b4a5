//
// distro-detect - Per-Distribution Checks Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <distro/checks.h>

#include <release/busybox_scanner.h>
#include <release/key_value.h>
#include <release/release_line.h>

#include <systemd/sd-journal.h>

#include <initializer_list>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

namespace distro_detect {

    namespace {

        //
        // Build a record carrying both property maps. An empty version
        // becomes "unknown".
        //
        auto make_distro(DetectionContext const& ctx,
                         std::string_view name,
                         std::string_view id,
                         std::string version) -> LinuxDistro {
            if (version.empty()) {
                version = unknown_value;
            }
            return LinuxDistro{
                .name = std::string{name},
                .id = std::string{id},
                .version = std::move(version),
                .lsb_properties = ctx.lsb_properties,
                .os_properties = ctx.os_properties,
            };
        }

        auto os_value(DetectionContext const& ctx, std::string const& key) -> std::string {
            return get_property(ctx.os_properties, key);
        }

        auto lsb_value(DetectionContext const& ctx, std::string const& key) -> std::string {
            return get_property(ctx.lsb_properties, key);
        }

        auto trim(std::string_view value) -> std::string {
            auto const whitespace = std::string_view{" \t\r\n\f\v"};
            auto begin = value.find_first_not_of(whitespace);
            if (begin == std::string_view::npos) {
                return {};
            }
            auto end = value.find_last_not_of(whitespace);
            return std::string{value.substr(begin, end - begin + 1)};
        }

        //
        // Read the first existing marker file and parse it as a Red Hat
        // style release line beginning with prefix.
        //
        auto match_release_file(DetectionContext const& ctx,
                                std::initializer_list<std::string_view> candidates,
                                std::string_view prefix) -> std::optional<std::string> {
            auto file = ctx.files.read_first(candidates);
            if (!file) {
                return std::nullopt;
            }
            return parse_release_line(file->contents, prefix);
        }

        //
        // Legacy SuSE/Novell files: a free-text header line followed by
        // "KEY = VALUE" lines. The version comes from the VERSION key.
        //
        auto match_header_with_version(DetectionContext const& ctx,
                                       std::initializer_list<std::string_view> candidates,
                                       std::string_view prefix) -> std::optional<std::string> {
            auto file = ctx.files.read_first(candidates);
            if (!file || !file->contents.starts_with(prefix)) {
                return std::nullopt;
            }
            return get_property(parse_properties(file->contents), "VERSION");
        }

        //
        // First capture group of the first non-blank, non-comment line
        // matching pattern.
        //
        auto find_first_capture(std::string const& contents, std::regex const& pattern)
            -> std::optional<std::string> {
            std::istringstream input{contents};
            std::string line;
            while (std::getline(input, line)) {
                if (line.empty() || line.front() == '#') {
                    continue;
                }
                std::smatch match;
                if (std::regex_search(line, match, pattern) && match.size() > 1) {
                    return match[1].str();
                }
            }
            return std::nullopt;
        }

        //
        // Simple os-release ID check taking the version from VERSION_ID.
        //
        auto match_os_id(DetectionContext const& ctx,
                         std::string_view expected_id,
                         std::string_view name,
                         std::string_view id) -> std::optional<LinuxDistro> {
            if (os_value(ctx, "ID") != expected_id) {
                return std::nullopt;
            }
            return make_distro(ctx, name, id, os_value(ctx, "VERSION_ID"));
        }

        //
        // os-release ID check that also requires a VERSION_ID.
        //
        auto match_os_id_with_version(DetectionContext const& ctx,
                                      std::string_view expected_id,
                                      std::string_view name,
                                      std::string_view id) -> std::optional<LinuxDistro> {
            auto version = os_value(ctx, "VERSION_ID");
            if (os_value(ctx, "ID") != expected_id || version.empty()) {
                return std::nullopt;
            }
            return make_distro(ctx, name, id, std::move(version));
        }

    }  // anonymous namespace

    auto detect_alpine(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (auto distro = match_os_id(ctx, "alpine", "Alpine Linux", "alpine")) {
            return distro;
        }

        if (auto file = ctx.files.read_first({"/etc/alpine-release"})) {
            return make_distro(ctx, "Alpine Linux", "alpine", trim(file->contents));
        }

        return std::nullopt;
    }

    auto detect_alt(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        return match_os_id(ctx, "altlinux", "ALT Starterkit", "altlinux");
    }

    auto detect_amazon_linux(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        return match_os_id(ctx, "amzn", "Amazon Linux", "amzn");
    }

    auto detect_android(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        auto file = ctx.files.read_first({"/system/build.prop"});
        if (!file) {
            return std::nullopt;
        }

        auto props = parse_properties(file->contents);
        auto version = get_property(props, "ro.com.google.gmsversion");
        if (version.empty()) {
            version = get_property(props, "ro.build.version.release");
        }

        return make_distro(ctx, "Android", "android", std::move(version));
    }

    auto detect_arch_linux(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (os_value(ctx, "ID") != "arch") {
            return std::nullopt;
        }
        // Rolling release; there is no version to report
        return make_distro(ctx, "Arch Linux", "arch", "rolling");
    }

    auto detect_busybox(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        // A real distribution built from BusyBox applets still ships a release file
        if (ctx.files.any_exists({os_release_path, os_release_fallback_path, lsb_release_path})) {
            return std::nullopt;
        }

        auto binary = ctx.files.open_first({"/bin/true"});
        if (!binary) {
            return std::nullopt;
        }

        auto version = scan_busybox_version(*binary->stream);
        if (!version) {
            sd_journal_print(LOG_ERR, "distro-detect: unable to scan file (%s): %s",
                             (*binary->path).c_str(), version.error().c_str());
            return std::nullopt;
        }
        if (!*version) {
            return std::nullopt;
        }

        return make_distro(ctx, "BusyBox", "busybox", std::move(**version));
    }

    auto detect_centos(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (auto oracle = detect_oracle_linux(ctx)) {
            return oracle;
        }

        if (auto version = match_release_file(ctx, {"/etc/centos-release", "/etc/redhat-release"},
                                              "CentOS")) {
            return make_distro(ctx, "CentOS Linux", "centos", std::move(*version));
        }

        return std::nullopt;
    }

    auto detect_clear_linux(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        return match_os_id(ctx, "clear-linux-os", "Clear Linux OS", "clear-linux-os");
    }

    auto detect_crux(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        // /usr/bin/crux is a shell script that echoes the version
        auto file = ctx.files.read_first({"/usr/bin/crux"});
        if (!file) {
            return std::nullopt;
        }

        static std::regex const pattern{R"(\s*echo "CRUX version ([0-9.]+)"\s*)"};
        auto version = find_first_capture(file->contents, pattern);

        return make_distro(ctx, "CRUX", "crux", version.value_or(std::string{}));
    }

    auto detect_debian(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (auto mx = detect_mx_linux(ctx)) {
            return mx;
        }

        auto debian_version = ctx.files.read_first({"/etc/debian_version"});
        if (!debian_version) {
            return std::nullopt;
        }

        // Derivatives such as Ubuntu keep /etc/debian_version but rebrand /etc/issue
        if (auto issue = ctx.files.read_first({"/etc/issue"})) {
            if (!issue->contents.starts_with("Debian")) {
                return std::nullopt;
            }
        }

        auto id = os_value(ctx, "ID");
        if (!id.empty() && id != "debian") {
            return std::nullopt;
        }

        return make_distro(ctx, "Debian GNU/Linux", "debian", trim(debian_version->contents));
    }

    auto detect_fedora(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (auto distro = match_os_id(ctx, "fedora", "Fedora", "fedora")) {
            return distro;
        }

        if (auto oracle = detect_oracle_linux(ctx)) {
            return oracle;
        }

        if (auto version = match_release_file(ctx, {"/etc/redhat-release"}, "Fedora")) {
            return make_distro(ctx, "Fedora", "fedora", std::move(*version));
        }

        return std::nullopt;
    }

    auto detect_gentoo(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (os_value(ctx, "ID") != "gentoo") {
            return std::nullopt;
        }

        auto version = match_release_file(ctx, {"/etc/gentoo-release"}, "Gentoo");
        return make_distro(ctx, "Gentoo", "gentoo", version.value_or(std::string{}));
    }

    auto detect_kali(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        return match_os_id(ctx, "kali", "Kali GNU/Linux", "kali");
    }

    auto detect_mageia(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (os_value(ctx, "ID") != "mageia") {
            return std::nullopt;
        }
        return make_distro(ctx, "Mageia", "mageia", os_value(ctx, "VERSION"));
    }

    auto detect_mint(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (lsb_value(ctx, "DISTRIB_ID") != "LinuxMint") {
            return std::nullopt;
        }
        return make_distro(ctx, "Linux Mint", "linuxmint", lsb_value(ctx, "DISTRIB_RELEASE"));
    }

    auto detect_mx_linux(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (lsb_value(ctx, "DISTRIB_ID") == "MX") {
            return make_distro(ctx, "MX Linux", "mx", lsb_value(ctx, "DISTRIB_RELEASE"));
        }

        // Older releases only carry e.g. "MX-19.2_ahs_x64 patito feo May 31, 2020"
        auto file = ctx.files.read_first({"/etc/mx-version"});
        if (!file) {
            return std::nullopt;
        }

        static std::regex const pattern{R"((\S+)-([0-9.]+))"};
        std::smatch match;
        if (std::regex_search(file->contents, match, pattern) && match[1] == "MX") {
            return make_distro(ctx, "MX Linux", "mx", match[2].str());
        }

        return std::nullopt;
    }

    auto detect_nixos(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        return match_os_id(ctx, "nixos", "NixOS", "nixos");
    }

    auto detect_novell_oes(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        auto version = match_header_with_version(ctx, {"/etc/novell-release"},
                                                 "Novell Open Enterprise Server");
        if (!version) {
            return std::nullopt;
        }
        return make_distro(ctx, "Novell Open Enterprise Server", "oes", std::move(*version));
    }

    auto detect_opensuse(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (auto distro = match_os_id(ctx, "opensuse", "openSUSE", "opensuse")) {
            return distro;
        }

        auto version = match_header_with_version(ctx, {"/etc/SuSE-release"}, "openSUSE");
        if (!version) {
            return std::nullopt;
        }
        return make_distro(ctx, "openSUSE", "opensuse", std::move(*version));
    }

    auto detect_oracle_linux(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (auto distro = match_os_id_with_version(ctx, "ol", "Oracle Linux", "ol")) {
            return distro;
        }

        if (auto version = match_release_file(ctx, {"/etc/oracle-release"}, "Oracle Linux")) {
            return make_distro(ctx, "Oracle Linux", "ol", std::move(*version));
        }

        return std::nullopt;
    }

    auto detect_photon(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (auto distro = match_os_id_with_version(ctx, "photon", "VMware Photon", "photon")) {
            return distro;
        }

        if (auto version = match_release_file(ctx, {"/etc/photon-release"}, "VMware Photon Linux")) {
            return make_distro(ctx, "VMware Photon", "photon", std::move(*version));
        }

        return std::nullopt;
    }

    auto detect_puppy(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (lsb_value(ctx, "DISTRIB_ID") != "Puppy") {
            return std::nullopt;
        }
        return make_distro(ctx, "Puppy Linux", "puppy", os_value(ctx, "VERSION_ID"));
    }

    auto detect_rancher_os(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        return match_os_id(ctx, "rancheros", "RancherOS", "rancheros");
    }

    auto detect_rhel(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (auto distro = match_os_id_with_version(ctx, "rhel", "Red Hat Enterprise Linux", "rhel")) {
            return distro;
        }

        if (auto oracle = detect_oracle_linux(ctx)) {
            return oracle;
        }

        if (auto version = match_release_file(ctx, {"/etc/redhat-release", "/etc/redhat-version"},
                                              "Red Hat Enterprise Linux")) {
            return make_distro(ctx, "Red Hat Enterprise Linux", "rhel", std::move(*version));
        }

        return std::nullopt;
    }

    auto detect_scientific_linux(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (auto oracle = detect_oracle_linux(ctx)) {
            return oracle;
        }

        if (auto version = match_release_file(ctx, {"/etc/sl-release", "/etc/redhat-release"},
                                              "Scientific Linux")) {
            return make_distro(ctx, "Scientific Linux", "scientific", std::move(*version));
        }

        return std::nullopt;
    }

    auto detect_slackware(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (auto distro = match_os_id_with_version(ctx, "slackware", "Slackware", "slackware")) {
            return distro;
        }

        auto file = ctx.files.read_first({"/etc/slackware-version"});
        if (!file || !file->contents.starts_with("Slackware")) {
            return std::nullopt;
        }

        // "Slackware 14.1"
        auto contents = trim(file->contents);
        auto space = contents.find(' ');
        auto version = space == std::string::npos ? std::string{} : contents.substr(space + 1);

        return make_distro(ctx, "Slackware", "slackware", std::move(version));
    }

    auto detect_sles(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (auto distro = match_os_id(ctx, "sles", "SUSE Linux", "sles")) {
            return distro;
        }

        auto version = match_header_with_version(ctx, {"/etc/SuSE-release", "/etc/sles-release"},
                                                 "SUSE Linux");
        if (!version) {
            return std::nullopt;
        }
        return make_distro(ctx, "SUSE Linux", "sles", std::move(*version));
    }

    auto detect_source_mage(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        auto file = ctx.files.read_first({"/etc/sourcemage-release"});
        if (!file) {
            return std::nullopt;
        }

        // "... (Grimoire 0.62-stable) generated on ..."
        static std::regex const pattern{R"(.*\((.+)\).*)"};
        auto version = find_first_capture(file->contents, pattern);

        return make_distro(ctx, "Source Mage GNU/Linux", "sourcemage", version.value_or(std::string{}));
    }

    auto detect_ubuntu(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (lsb_value(ctx, "DISTRIB_ID") != "Ubuntu") {
            return std::nullopt;
        }
        return make_distro(ctx, "Ubuntu", "ubuntu", lsb_value(ctx, "DISTRIB_RELEASE"));
    }

    auto detect_yellow_dog(DetectionContext const& ctx) -> std::optional<LinuxDistro> {
        if (auto version = match_release_file(ctx, {"/etc/yellowdog-release"}, "Yellow Dog Linux")) {
            return make_distro(ctx, "Yellow Dog Linux", "yellow-dog", std::move(*version));
        }
        return std::nullopt;
    }

}  // namespace distro_detect

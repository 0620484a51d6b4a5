//
// distro-detect - Distribution Detection Tests
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <distro/checks.h>
#include <distro/classifier.h>
#include <distro/detector.h>
#include <fs/file_resolver.h>
#include <fs/file_source.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace distro_detect {

    using namespace std::string_literals;

    namespace {

        struct DistroCase {
            std::string label;
            std::vector<std::pair<std::string, std::string>> files;
            std::string id;
            std::string name;
            std::string version;
        };

        auto const debian_issue_10 = "Debian GNU/Linux 10 \\n \\l\n"s;

        auto const debian_buster_os_release =
            "PRETTY_NAME=\"Debian GNU/Linux 10 (buster)\"\n"
            "NAME=\"Debian GNU/Linux\"\n"
            "VERSION_ID=\"10\"\n"
            "VERSION=\"10 (buster)\"\n"
            "VERSION_CODENAME=buster\n"
            "ID=debian\n"
            "HOME_URL=\"https://www.debian.org/\"\n"s;

        auto const busybox_true =
            "\x7f" "ELF\x02\x01\x01\0\0\0\0\0\0\0\0\0"
            "applet not found\0BusyBox v1.32.0 (2020-10-21 13:19:53 UTC) multi-call binary.\0"
            "Usage: busybox [function [arguments]...]\0"s;

        //
        // Real-world release file contents, one entry per supported system.
        //
        auto distro_cases() -> std::vector<DistroCase> const& {
            static std::vector<DistroCase> const cases{
                {"alpine-old", {{"/etc/alpine-release", "3.12.1\n"}},
                 "alpine", "Alpine Linux", "3.12.1"},
                {"alpine-3", {{"/etc/alpine-release", "3.12.1\n"},
                              {"/etc/os-release",
                               "NAME=\"Alpine Linux\"\nID=alpine\nVERSION_ID=3.12.1\n"
                               "PRETTY_NAME=\"Alpine Linux v3.12\"\n"}},
                 "alpine", "Alpine Linux", "3.12.1"},
                {"alt", {{"/etc/os-release",
                          "NAME=\"starter kit\"\nVERSION=\"p9 (Hypericum)\"\nID=altlinux\n"
                          "VERSION_ID=p9\nPRETTY_NAME=\"ALT Starterkit (Hypericum)\"\n"}},
                 "altlinux", "ALT Starterkit", "p9"},
                {"amazon-2", {{"/etc/os-release",
                               "NAME=\"Amazon Linux\"\nVERSION=\"2\"\nID=\"amzn\"\n"
                               "ID_LIKE=\"centos rhel fedora\"\nVERSION_ID=\"2\"\n"
                               "PRETTY_NAME=\"Amazon Linux 2\"\n"}},
                 "amzn", "Amazon Linux", "2"},
                {"android", {{"/system/build.prop",
                              "\n# begin build properties\nro.build.id=PI\n"
                              "ro.build.version.release=9\nro.build.version.base_os=\n"
                              "ro.build.date=Wed Mar 25 11:28:56 CST 2020\n"
                              "ro.com.google.gmsversion=9.0_r1\n# end build properties\n"}},
                 "android", "Android", "9.0_r1"},
                {"android-without-gms", {{"/system/build.prop",
                                          "ro.build.id=PI\nro.build.version.release=9\n"}},
                 "android", "Android", "9"},
                {"arch", {{"/etc/os-release",
                           "NAME=\"Arch Linux\"\nPRETTY_NAME=\"Arch Linux\"\nID=arch\n"
                           "BUILD_ID=rolling\nLOGO=archlinux\n"}},
                 "arch", "Arch Linux", "rolling"},
                {"busybox", {{"/bin/true", busybox_true}},
                 "busybox", "BusyBox", "v1.32.0"},
                {"centos-5", {{"/etc/redhat-release", "CentOS release 5.11 (Final)\n"}},
                 "centos", "CentOS Linux", "5.11"},
                {"centos-6", {{"/etc/centos-release", "CentOS release 6.10 (Final)\n"},
                              {"/etc/redhat-release", "CentOS release 6.10 (Final)\n"}},
                 "centos", "CentOS Linux", "6.10"},
                {"centos-7", {{"/etc/centos-release", "CentOS Linux release 7.8.2003 (Core)\n"},
                              {"/etc/os-release",
                               "NAME=\"CentOS Linux\"\nVERSION=\"7 (Core)\"\nID=\"centos\"\n"
                               "ID_LIKE=\"rhel fedora\"\nVERSION_ID=\"7\"\n"}},
                 "centos", "CentOS Linux", "7.8.2003"},
                {"centos-8", {{"/etc/centos-release", "CentOS Linux release 8.2.2004 (Core) \n"},
                              {"/etc/os-release",
                               "NAME=\"CentOS Linux\"\nVERSION=\"8 (Core)\"\nID=\"centos\"\n"
                               "ID_LIKE=\"rhel fedora\"\nVERSION_ID=\"8\"\n"}},
                 "centos", "CentOS Linux", "8.2.2004"},
                {"clear-linux", {{"/usr/lib/os-release",
                                  "NAME=\"Clear Linux OS\"\nVERSION=1\nID=clear-linux-os\n"
                                  "ID_LIKE=clear-linux-os\nVERSION_ID=33910\n"}},
                 "clear-linux-os", "Clear Linux OS", "33910"},
                {"crux-3", {{"/usr/bin/crux",
                             "#!/bin/sh\n\necho \"CRUX version 3.0\"\n\n# End of file\n"}},
                 "crux", "CRUX", "3.0"},
                {"crux-without-version", {{"/usr/bin/crux", "#!/bin/sh\n\necho \"CRUX\"\n"}},
                 "crux", "CRUX", "unknown"},
                {"debian-6", {{"/etc/debian_version", "6.0.10\n"},
                              {"/etc/issue", "Debian GNU/Linux 6.0 \\n \\l\n"}},
                 "debian", "Debian GNU/Linux", "6.0.10"},
                {"debian-10", {{"/etc/debian_version", "10.6\n"},
                               {"/etc/issue", debian_issue_10},
                               {"/etc/os-release", debian_buster_os_release}},
                 "debian", "Debian GNU/Linux", "10.6"},
                {"fedora-20", {{"/etc/redhat-release", "Fedora release 20 (Heisenbug)\n"},
                               {"/etc/os-release",
                                "NAME=Fedora\nVERSION=\"20 (Heisenbug)\"\nID=fedora\n"
                                "VERSION_ID=20\n"}},
                 "fedora", "Fedora", "20"},
                {"fedora-20-release-file-only",
                 {{"/etc/redhat-release", "Fedora release 20 (Heisenbug)\n"}},
                 "fedora", "Fedora", "20"},
                {"gentoo-1", {{"/etc/gentoo-release", "Gentoo Base System version 1.6.14\n"},
                              {"/etc/os-release", "NAME=Gentoo\nID=gentoo\n"}},
                 "gentoo", "Gentoo", "1.6.14"},
                {"gentoo-2", {{"/etc/gentoo-release", "Gentoo Base System release 2.6\n"},
                              {"/etc/os-release", "NAME=Gentoo\nID=gentoo\n"}},
                 "gentoo", "Gentoo", "2.6"},
                {"gentoo-without-release-file", {{"/etc/os-release", "NAME=Gentoo\nID=gentoo\n"}},
                 "gentoo", "Gentoo", "unknown"},
                {"gentoo-unparsable-release-file",
                 {{"/etc/gentoo-release", "Gentoo Base System\n"},
                  {"/etc/os-release", "NAME=Gentoo\nID=gentoo\n"}},
                 "gentoo", "Gentoo", "unknown"},
                {"kali", {{"/etc/os-release",
                           "NAME=\"Kali GNU/Linux\"\nID=kali\nVERSION=\"2020.3\"\n"
                           "VERSION_ID=\"2020.3\"\nID_LIKE=debian\n"}},
                 "kali", "Kali GNU/Linux", "2020.3"},
                {"mageia-3", {{"/etc/lsb-release", "DISTRIB_ID=\"Mageia\"\nDISTRIB_RELEASE=3\n"},
                              {"/etc/os-release",
                               "NAME=\"Mageia\"\nVERSION=\"3\"\nID=mageia\n"
                               "ID_LIKE=\"mandriva fedora\"\n"}},
                 "mageia", "Mageia", "3"},
                {"mint-20", {{"/etc/lsb-release",
                              "DISTRIB_ID=LinuxMint\nDISTRIB_RELEASE=20\n"
                              "DISTRIB_CODENAME=ulyana\n"},
                             {"/etc/os-release",
                              "NAME=\"Linux Mint\"\nVERSION=\"20 (Ulyana)\"\nID=linuxmint\n"
                              "ID_LIKE=ubuntu\nVERSION_ID=\"20\"\n"}},
                 "linuxmint", "Linux Mint", "20"},
                {"mx-old", {{"/etc/mx-version", "MX-19.2_ahs_x64 patito feo May 31, 2020\n"},
                            {"/etc/debian_version", "10.6\n"},
                            {"/etc/issue", debian_issue_10}},
                 "mx", "MX Linux", "19.2"},
                {"mx", {{"/etc/mx-version", "MX-19.2_ahs_x64 patito feo May 31, 2020\n"},
                        {"/etc/debian_version", "10.6\n"},
                        {"/etc/issue", debian_issue_10},
                        {"/etc/lsb-release", "DISTRIB_ID=MX\nDISTRIB_RELEASE=19.2\n"},
                        {"/etc/os-release", debian_buster_os_release}},
                 "mx", "MX Linux", "19.2"},
                {"nixos", {{"/etc/os-release",
                            "NAME=NixOS\nID=nixos\nVERSION=\"20.09 (Nightingale)\"\n"
                            "VERSION_ID=\"20.09\"\n"}},
                 "nixos", "NixOS", "20.09"},
                {"novell-oes", {{"/etc/novell-release",
                                 "Novell Open Enterprise Server 2.0.1 (i586)\nVERSION = 2.0.1\n"
                                 "PATCHLEVEL = 1\nBUILD\n"}},
                 "oes", "Novell Open Enterprise Server", "2.0.1"},
                {"opensuse-old", {{"/etc/SuSE-release",
                                   "openSUSE 42.1 (x86_64)\nVERSION = 42.1\nCODENAME = Malachite\n"
                                   "# /etc/SuSE-release is deprecated and will be removed in the "
                                   "future, use /etc/os-release instead\n"}},
                 "opensuse", "openSUSE", "42.1"},
                {"opensuse-42", {{"/etc/SuSE-release",
                                  "openSUSE 42.1 (x86_64)\nVERSION = 42.1\nCODENAME = Malachite\n"},
                                 {"/etc/os-release",
                                  "NAME=\"openSUSE Leap\"\nVERSION=\"42.1\"\nID=opensuse\n"
                                  "ID_LIKE=\"suse\"\nVERSION_ID=\"42.1\"\n"}},
                 "opensuse", "openSUSE", "42.1"},
                {"oracle-6-old", {{"/etc/redhat-release",
                                   "Red Hat Enterprise Linux Server release 6.10 (Santiago)\n"},
                                  {"/etc/oracle-release", "Oracle Linux Server release 6.10\n"}},
                 "ol", "Oracle Linux", "6.10"},
                {"oracle-7", {{"/etc/redhat-release",
                               "Red Hat Enterprise Linux Server release 7.9 (Maipo)\n"},
                              {"/etc/oracle-release", "Oracle Linux Server release 7.9\n"},
                              {"/etc/os-release",
                               "NAME=\"Oracle Linux Server\" \nVERSION=\"7.9\" \nID=\"ol\" \n"
                               "ID_LIKE=\"fedora\"\nVERSION_ID=\"7.9\" \n"}},
                 "ol", "Oracle Linux", "7.9"},
                {"oracle-8", {{"/etc/redhat-release", "Oracle Linux Server release 7.9\n"},
                              {"/etc/oracle-release", "Oracle Linux Server release 8.2\n"},
                              {"/etc/os-release",
                               "NAME=\"Oracle Linux Server\"\nVERSION=\"8.2\"\nID=\"ol\"\n"
                               "ID_LIKE=\"fedora\"\nVERSION_ID=\"8.2\"\n"}},
                 "ol", "Oracle Linux", "8.2"},
                {"oracle-empty-version-id",
                 {{"/etc/redhat-release",
                   "Red Hat Enterprise Linux Server release 6.10 (Santiago)\n"},
                  {"/etc/oracle-release", "Oracle Linux Server release 6.10\n"},
                  {"/etc/os-release", "NAME=\"Oracle Linux Server\"\nID=\"ol\"\nVERSION_ID=\"\"\n"}},
                 "ol", "Oracle Linux", "6.10"},
                {"photon", {{"/etc/lsb-release",
                             "DISTRIB_ID=\"VMware Photon\"\nDISTRIB_RELEASE=\"1.0\"\n"},
                            {"/etc/os-release",
                             "NAME=\"VMware Photon\"\nVERSION=\"1.0\"\nID=photon\n"
                             "VERSION_ID=1.0\n"}},
                 "photon", "VMware Photon", "1.0"},
                {"photon-release-file-only", {{"/etc/photon-release",
                                               "VMware Photon Linux release 2.0 (Photon)\n"}},
                 "photon", "VMware Photon", "2.0"},
                {"puppy", {{"/etc/lsb-release", "DISTRIB_ID=Puppy\nDISTRIB_RELEASE=9\n"},
                           {"/etc/os-release",
                            "NAME=Puppy\nVERSION=\"9.5\"\nID=puppy_fossapup64\n"
                            "VERSION_ID=9.5\n"}},
                 "puppy", "Puppy Linux", "9.5"},
                {"rancheros", {{"/etc/lsb-release",
                                "DISTRIB_ID=RancherOS\nDISTRIB_RELEASE=v1.5.6\n"},
                               {"/etc/os-release",
                                "NAME=\"RancherOS\"\nVERSION=v1.5.6\nID=rancheros\nID_LIKE=\n"
                                "VERSION_ID=v1.5.6\n"}},
                 "rancheros", "RancherOS", "v1.5.6"},
                {"rhel-6", {{"/etc/redhat-release",
                             "Red Hat Enterprise Linux Server release 6.5 (Santiago)\n"}},
                 "rhel", "Red Hat Enterprise Linux", "6.5"},
                {"rhel-7", {{"/etc/redhat-release",
                             "Red Hat Enterprise Linux Server release 7.6 (Maipo)\n"},
                            {"/etc/os-release",
                             "NAME=\"Red Hat Enterprise Linux Server\"\nVERSION=\"7.6 (Maipo)\"\n"
                             "ID=\"rhel\"\nID_LIKE=\"fedora\"\nVERSION_ID=\"7.6\"\n"}},
                 "rhel", "Red Hat Enterprise Linux", "7.6"},
                {"rhel-version-file-only", {{"/etc/redhat-version",
                                             "Red Hat Enterprise Linux Server release 5.11 (Tikanga)\n"}},
                 "rhel", "Red Hat Enterprise Linux", "5.11"},
                {"scientific-6", {{"/etc/sl-release", "Scientific Linux release 6.10 (Carbon)\n"},
                                  {"/etc/redhat-release",
                                   "Scientific Linux release 6.10 (Carbon)\n"}},
                 "scientific", "Scientific Linux", "6.10"},
                {"scientific-7", {{"/etc/redhat-release",
                                   "Scientific Linux release 7.9 (Nitrogen)\n"},
                                  {"/etc/os-release",
                                   "NAME=\"Scientific Linux\"\nVERSION=\"7.9 (Nitrogen)\"\n"
                                   "ID=\"scientific\"\nID_LIKE=\"rhel centos fedora\"\n"
                                   "VERSION_ID=\"7.9\"\n"}},
                 "scientific", "Scientific Linux", "7.9"},
                {"sles-old", {{"/etc/SuSE-release",
                               "SUSE Linux Enterprise Server 12 (x86_64)\nVERSION = 12\n"
                               "PATCHLEVEL = 1\n"}},
                 "sles", "SUSE Linux", "12"},
                {"sles-12", {{"/etc/SuSE-release",
                              "SUSE Linux Enterprise Server 12 (x86_64)\nVERSION = 12\n"
                              "PATCHLEVEL = 1\n"},
                             {"/etc/os-release",
                              "NAME=\"SLES\"\nVERSION=\"12\"\nVERSION_ID=\"12\"\nID=\"sles\"\n"}},
                 "sles", "SUSE Linux", "12"},
                {"sles-release-file-only", {{"/etc/sles-release",
                                             "SUSE Linux Enterprise Server 11 (x86_64)\nVERSION = 11\n"
                                             "PATCHLEVEL = 4\n"}},
                 "sles", "SUSE Linux", "11"},
                {"slackware-old", {{"/etc/slackware-version", "Slackware 14.1"}},
                 "slackware", "Slackware", "14.1"},
                {"slackware-14", {{"/etc/slackware-version", "Slackware 14.1\n"},
                                  {"/etc/os-release",
                                   "NAME=Slackware\nVERSION=\"14.1\"\nID=slackware\n"
                                   "VERSION_ID=14.1\n"}},
                 "slackware", "Slackware", "14.1"},
                {"source-mage", {{"/etc/sourcemage-release",
                                  "Source Mage GNU/Linux x86_64-pc-linux-gnu\n"
                                  "Installed from tarball using chroot image (Grimoire "
                                  "0.62-stable) generated on Thu Dec  1 01:34:47 UTC 2016\n"}},
                 "sourcemage", "Source Mage GNU/Linux", "Grimoire 0.62-stable"},
                {"source-mage-without-version", {{"/etc/sourcemage-release",
                                                  "Source Mage GNU/Linux x86_64-pc-linux-gnu\n"}},
                 "sourcemage", "Source Mage GNU/Linux", "unknown"},
                {"ubuntu-5.10", {{"/etc/lsb-release",
                                  "DISTRIB_ID=Ubuntu\nDISTRIB_RELEASE=5.10\n"
                                  "DISTRIB_CODENAME=breezy\n"}},
                 "ubuntu", "Ubuntu", "5.10"},
                {"ubuntu-20.04", {{"/etc/lsb-release",
                                   "DISTRIB_ID=Ubuntu\nDISTRIB_RELEASE=20.04\n"
                                   "DISTRIB_CODENAME=focal\n"
                                   "DISTRIB_DESCRIPTION=\"Ubuntu 20.04.1 LTS\"\n"},
                                  {"/etc/debian_version", "bullseye/sid\n"},
                                  {"/etc/issue", "Ubuntu 20.04.1 LTS \\n \\l\n"},
                                  {"/etc/os-release",
                                   "NAME=\"Ubuntu\"\nVERSION=\"20.04.1 LTS (Focal Fossa)\"\n"
                                   "ID=ubuntu\nID_LIKE=debian\nVERSION_ID=\"20.04\"\n"}},
                 "ubuntu", "Ubuntu", "20.04"},
                {"yellow-dog", {{"/etc/yellowdog-release",
                                 "Yellow Dog Linux release 4.0 (Orion)\n"}},
                 "yellow-dog", "Yellow Dog Linux", "4.0"},
            };
            return cases;
        }

        auto make_source(DistroCase const& distro_case, std::string_view root = "/")
            -> MemoryFileSource {
            MemoryFileSource source;
            for (auto const& [path, contents] : distro_case.files) {
                source.add_file(std::filesystem::path{root} / std::filesystem::path{path}.relative_path(),
                                contents);
            }
            return source;
        }

        auto expect_detected(LinuxDistro const& distro, DistroCase const& distro_case) -> void {
            EXPECT_EQ(distro.id, distro_case.id);
            EXPECT_EQ(distro.name, distro_case.name);
            EXPECT_EQ(distro.version, distro_case.version);
        }

    }  // anonymous namespace

    TEST(DistroDetectorTest, DetectsEverySupportedDistribution) {
        for (auto const& distro_case : distro_cases()) {
            SCOPED_TRACE(distro_case.label);

            auto source = make_source(distro_case);
            FileResolver files{source};
            Classifier classifier{files};

            expect_detected(classifier.discover(), distro_case);
        }
    }

    TEST(DistroDetectorTest, DetectionIsIndependentOfDetectorOrder) {
        for (std::uint32_t seed = 1; seed <= 8; ++seed) {
            auto detectors = default_detectors();
            std::mt19937 rng{seed};
            std::shuffle(detectors.begin(), detectors.end(), rng);

            for (auto const& distro_case : distro_cases()) {
                SCOPED_TRACE(distro_case.label + " seed " + std::to_string(seed));

                auto source = make_source(distro_case);
                FileResolver files{source};
                Classifier classifier{files, detectors};

                expect_detected(classifier.discover(), distro_case);
            }
        }
    }

    TEST(DistroDetectorTest, FilesystemRootPrefix) {
        auto const& cases = distro_cases();
        auto found = std::ranges::find(cases, std::string{"centos-7"}, &DistroCase::label);
        ASSERT_NE(found, cases.end());
        auto const& centos = *found;

        auto source = make_source(centos, "/var/lib/machines/build");
        FileResolver files{source, "/var/lib/machines/build"};
        Classifier classifier{files};

        expect_detected(classifier.discover(), centos);

        // Nothing at the real root
        FileResolver real_root{source};
        Classifier unprefixed{real_root};
        auto guess = unprefixed.discover();
        EXPECT_EQ(guess.id, "unknown");
        EXPECT_EQ(guess.name, "Unknown");
    }

    TEST(DistroDetectorTest, RecordCarriesPropertyMaps) {
        MemoryFileSource source;
        source.add_file("/etc/lsb-release", "DISTRIB_ID=Ubuntu\nDISTRIB_RELEASE=18.04\n")
              .add_file("/etc/os-release", "NAME=\"Ubuntu\"\nID=ubuntu\nVERSION_ID=\"18.04\"\n");
        FileResolver files{source};
        Classifier classifier{files};

        auto distro = classifier.discover();
        EXPECT_EQ(distro.id, "ubuntu");
        EXPECT_EQ(distro.lsb_properties.at("DISTRIB_RELEASE"), "18.04");
        EXPECT_EQ(distro.os_properties.at("NAME"), "Ubuntu");
        EXPECT_EQ(distro.os_properties.size(), 3);
    }

    TEST(DistroDetectorTest, OsReleaseFallbackLocation) {
        MemoryFileSource source;
        source.add_file("/usr/lib/os-release", "ID=kali\nVERSION_ID=2020.3\n");
        FileResolver files{source};
        Classifier classifier{files};

        auto distro = classifier.discover();
        EXPECT_EQ(distro.id, "kali");
        EXPECT_EQ(distro.version, "2020.3");
        EXPECT_EQ(distro.os_properties.at("ID"), "kali");
    }

    TEST(DistroDetectorTest, OraclePrecedesRedHatClone) {
        MemoryFileSource source;
        source.add_file("/etc/redhat-release",
                        "Red Hat Enterprise Linux Server release 6.10 (Santiago)\n")
              .add_file("/etc/oracle-release", "Oracle Linux Server release 6.10\n");
        FileResolver files{source};

        // Even when probed on its own the RHEL check defers to Oracle Linux
        Classifier rhel_only{files, {{"rhel", detect_rhel}}};
        auto distro = rhel_only.discover();
        EXPECT_EQ(distro.id, "ol");
        EXPECT_EQ(distro.name, "Oracle Linux");
        EXPECT_EQ(distro.version, "6.10");
    }

    TEST(DistroDetectorTest, MxPrecedesDebian) {
        MemoryFileSource source;
        source.add_file("/etc/mx-version", "MX-19.2_ahs_x64 patito feo May 31, 2020\n")
              .add_file("/etc/debian_version", "10.6\n")
              .add_file("/etc/issue", "Debian GNU/Linux 10 \\n \\l\n");
        FileResolver files{source};

        Classifier debian_only{files, {{"debian", detect_debian}}};
        EXPECT_EQ(debian_only.discover().id, "mx");
    }

    TEST(DistroDetectorTest, DebianRejectsRebrandedIssue) {
        MemoryFileSource source;
        source.add_file("/etc/debian_version", "bullseye/sid\n")
              .add_file("/etc/issue", "Ubuntu 20.04.1 LTS \\n \\l\n");
        FileResolver files{source};

        Classifier debian_only{files, {{"debian", detect_debian}}};
        auto distro = debian_only.discover();
        EXPECT_NE(distro.id, "debian");
    }

    TEST(DistroDetectorTest, BusyBoxRequiresNoReleaseFiles) {
        MemoryFileSource source;
        source.add_file("/bin/true", busybox_true)
              .add_file("/etc/os-release", "NAME=\"Alpine Linux\"\nID=alpine\nVERSION_ID=3.12.1\n");
        FileResolver files{source};
        Classifier classifier{files};

        auto distro = classifier.discover();
        EXPECT_EQ(distro.id, "alpine");

        Classifier busybox_only{files, {{"busybox", detect_busybox}}};
        EXPECT_NE(busybox_only.discover().id, "busybox");
    }

    TEST(DistroDetectorTest, BusyBoxWithoutBanner) {
        MemoryFileSource source;
        source.add_file("/bin/true", "\x7f" "ELF\0\0GNU coreutils 8.32\0"s);
        FileResolver files{source};
        Classifier classifier{files};

        auto distro = classifier.discover();
        EXPECT_EQ(distro.id, "unknown");
        EXPECT_EQ(distro.version, "unknown");
    }

    TEST(DistroDetectorTest, ReleaseLineWithoutMatchIsNotDetected) {
        MemoryFileSource source;
        source.add_file("/etc/yellowdog-release", "Some Other Linux release 1.0\n");
        FileResolver files{source};
        Classifier classifier{files};

        EXPECT_EQ(classifier.discover().id, "unknown");
    }

    TEST(DistroDetectorTest, DetectionIsRepeatable) {
        auto const& distro_case = distro_cases().front();
        auto source = make_source(distro_case);
        FileResolver files{source};
        Classifier classifier{files};

        auto first = classifier.discover();
        auto second = classifier.discover();
        EXPECT_EQ(first, second);
    }

    TEST(DistroDetectorTest, ClassifyFromPropertyMaps) {
        MemoryFileSource source;
        FileResolver files{source};
        Classifier classifier{files};

        PropertyMap const lsb{{"DISTRIB_ID", "Ubuntu"}, {"DISTRIB_RELEASE", "14.04"}};
        PropertyMap const os{{"ID", "ubuntu"}, {"VERSION_ID", "14.04"}};

        auto distro = classifier.classify(lsb, os);
        EXPECT_EQ(distro.id, "ubuntu");
        EXPECT_EQ(distro.version, "14.04");
        EXPECT_EQ(distro.lsb_properties, lsb);
        EXPECT_EQ(distro.os_properties, os);
    }

    TEST(DistroDetectorTest, UnrecognizedSystemFallsBackToBestGuess) {
        MemoryFileSource source;
        FileResolver files{source};
        Classifier classifier{files};

        auto distro = classifier.classify({}, {{"ID", "exotic-os"}});
        EXPECT_EQ(distro.id, "exotic-os");
        EXPECT_EQ(distro.name, "exotic-os");
        EXPECT_EQ(distro.version, "unknown");
    }

    TEST(DistroDetectorTest, UnreadableReleaseFileIsTreatedAsEmpty) {
        MemoryFileSource source;
        source.add_unreadable("/etc/os-release")
              .add_file("/etc/lsb-release", "DISTRIB_ID=Ubuntu\nDISTRIB_RELEASE=5.10\n");
        FileResolver files{source};
        Classifier classifier{files};

        auto distro = classifier.discover();
        EXPECT_EQ(distro.id, "ubuntu");
        EXPECT_EQ(distro.version, "5.10");
        EXPECT_TRUE(distro.os_properties.empty());
    }

    TEST(DistroDetectorTest, DetectorNamesInEvaluationOrder) {
        auto names = detector_names(default_detectors());

        ASSERT_FALSE(names.empty());
        EXPECT_EQ(names.front(), "centos");
        EXPECT_EQ(names.back(), "busybox");

        std::set<std::string> const unique(names.begin(), names.end());
        EXPECT_EQ(unique.size(), names.size());
    }

}  // namespace distro_detect

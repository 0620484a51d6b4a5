//
// distro-detect - Distribution Classification Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <distro/classifier.h>

#include <distro/fallback.h>
#include <release/key_value.h>

#include <systemd/sd-journal.h>

namespace distro_detect {

    Classifier::Classifier(FileResolver const& files)
        : Classifier{files, default_detectors()} {
    }

    Classifier::Classifier(FileResolver const& files, std::vector<DistroDetector> detectors)
        : m_files{files}, m_detectors{std::move(detectors)} {
    }

    auto Classifier::read_release_file(std::initializer_list<std::string_view> candidates) const
        -> PropertyMap {

        auto opened = m_files.open_first(candidates);
        if (!opened) {
            sd_journal_print(LOG_DEBUG, "distro-detect: unable to find release file: %s",
                             opened.error().c_str());
            return {};
        }

        auto properties = parse_properties(*opened->stream);
        if (!properties) {
            sd_journal_print(LOG_ERR, "distro-detect: unable to read release file (%s): %s",
                             (*opened->path).c_str(), properties.error().c_str());
            return {};
        }

        return std::move(*properties);
    }

    auto Classifier::discover() const -> LinuxDistro {
        auto lsb_properties = read_release_file({lsb_release_path});
        auto os_properties = read_release_file({os_release_path, os_release_fallback_path});

        return classify(lsb_properties, os_properties);
    }

    auto Classifier::classify(PropertyMap const& lsb_properties,
                              PropertyMap const& os_properties) const -> LinuxDistro {

        DetectionContext const ctx{lsb_properties, os_properties, m_files};

        for (auto const& detector : m_detectors) {
            if (auto distro = detector.detect(ctx)) {
                sd_journal_print(LOG_DEBUG, "distro-detect: matched by %.*s detector",
                                 static_cast<int>(detector.name.size()), detector.name.data());
                return std::move(*distro);
            }
        }

        sd_journal_print(LOG_WARNING,
                         "distro-detect: distro is not part of the existing data set - attempting best guess");
        return best_guess(lsb_properties, os_properties);
    }

}  // namespace distro_detect

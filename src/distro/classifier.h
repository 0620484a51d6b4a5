//
// distro-detect - Distribution Classification
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_DISTRO_CLASSIFIER_H
#define DISTRO_DETECT_DISTRO_CLASSIFIER_H

#include <core/types.h>
#include <distro/detector.h>
#include <distro/linux_distro.h>
#include <fs/file_resolver.h>

#include <initializer_list>
#include <string_view>
#include <vector>

namespace distro_detect {

    //
    // Identifies the running (or mounted) distribution.
    //
    // Detection strategy:
    // 1. Read /etc/lsb-release and /etc/os-release (or /usr/lib/os-release)
    // 2. Try each detector in order; the first match wins
    // 3. If nothing matches, synthesize a best guess from the property maps
    //
    // Example:
    //   RealFileSource source;
    //   FileResolver files{source, "/mnt/image"};
    //   Classifier classifier{files};
    //   auto distro = classifier.discover();
    //
    class Classifier {
    public:
        //
        // Classifier using default_detectors().
        //
        // Preconditions:
        //   - files must outlive the classifier
        //
        explicit Classifier(FileResolver const& files);

        //
        // Classifier using a custom detector list, tried in the given order.
        //
        Classifier(FileResolver const& files, std::vector<DistroDetector> detectors);

        //
        // Read the release files and classify.
        //
        // Postconditions:
        //   - Always returns a record with non-empty id and name
        //
        [[nodiscard]] auto discover() const -> LinuxDistro;

        //
        // Classify from already parsed property maps.
        //
        // Detectors may still read marker files through the resolver.
        //
        [[nodiscard]] auto classify(PropertyMap const& lsb_properties,
                                    PropertyMap const& os_properties) const -> LinuxDistro;

        //
        // Parse the first existing candidate as a KEY=VALUE file.
        //
        // Returns an empty map if no candidate exists or reading fails.
        //
        [[nodiscard]] auto read_release_file(std::initializer_list<std::string_view> candidates) const
            -> PropertyMap;

        [[nodiscard]] auto detectors() const -> std::vector<DistroDetector> const& {
            return m_detectors;
        }

    private:
        FileResolver const& m_files;
        std::vector<DistroDetector> m_detectors;
    };

}  // namespace distro_detect

#endif  // DISTRO_DETECT_DISTRO_CLASSIFIER_H

//
// distro-detect - Best Guess for Unrecognized Distributions
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_DISTRO_FALLBACK_H
#define DISTRO_DETECT_DISTRO_FALLBACK_H

#include <core/types.h>
#include <distro/linux_distro.h>

namespace distro_detect {

    //
    // Synthesize a record from whatever the property maps provide.
    //
    // Resolution order (first non-empty wins):
    //   id:      os ID, lowercased lsb DISTRIB_ID, "unknown"
    //   name:    os NAME, first word of os PRETTY_NAME, lsb DISTRIB_ID,
    //            os ID, "Unknown"
    //   version: os VERSION_ID, lsb DISTRIB_RELEASE, first word of os
    //            VERSION, "unknown"
    //
    // Never fails.
    //
    [[nodiscard]] auto best_guess(PropertyMap const& lsb_properties,
                                  PropertyMap const& os_properties) -> LinuxDistro;

}  // namespace distro_detect

#endif  // DISTRO_DETECT_DISTRO_FALLBACK_H

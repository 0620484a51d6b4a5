// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#pragma once

#include <core/types.h>
#include <distro/linux_distro.h>

#include <string>

namespace distro_detect::output::json {

/// Escape a string for JSON (handles quotes, backslashes, control characters)
std::string escape(const std::string& str);

/// Serialize a property map as a JSON object (keys in sorted order)
std::string to_json(const PropertyMap& properties, bool pretty = false, int indent_level = 0);

/// Serialize a LinuxDistro to JSON
///
/// Keys are emitted as name, id, version, lsb_release, os_release.
/// Pretty output is indented with two spaces per level.
std::string to_json(const LinuxDistro& distro, bool pretty = false);

} // namespace distro_detect::output::json

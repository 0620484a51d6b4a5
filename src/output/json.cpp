// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#include "json.h"

#include <iomanip>
#include <sstream>

namespace distro_detect::output::json {

namespace {

std::string indent(bool pretty, int level) {
    return pretty ? std::string(static_cast<std::size_t>(level) * 2, ' ') : std::string{};
}

} // namespace

std::string escape(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\b':
            oss << "\\b";
            break;
        case '\f':
            oss << "\\f";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                // Control characters
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                oss << c;
            }
            break;
        }
    }
    return oss.str();
}

std::string to_json(const PropertyMap& properties, bool pretty, int indent_level) {
    if (properties.empty()) {
        return "{}";
    }

    const char* separator = pretty ? ": " : ":";
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : properties) {
        if (!first) {
            oss << ",";
        }
        first = false;
        if (pretty) {
            oss << "\n" << indent(pretty, indent_level + 1);
        }
        oss << "\"" << escape(key) << "\"" << separator << "\"" << escape(value) << "\"";
    }
    if (pretty) {
        oss << "\n" << indent(pretty, indent_level);
    }
    oss << "}";
    return oss.str();
}

std::string to_json(const LinuxDistro& distro, bool pretty) {
    const char* separator = pretty ? ": " : ":";
    const std::string newline = pretty ? "\n" : "";
    const std::string field_indent = indent(pretty, 1);

    std::ostringstream oss;
    oss << "{" << newline;
    oss << field_indent << "\"name\"" << separator << "\"" << escape(distro.name) << "\"," << newline;
    oss << field_indent << "\"id\"" << separator << "\"" << escape(distro.id) << "\"," << newline;
    oss << field_indent << "\"version\"" << separator << "\"" << escape(distro.version) << "\","
        << newline;
    oss << field_indent << "\"lsb_release\"" << separator
        << to_json(distro.lsb_properties, pretty, 1) << "," << newline;
    oss << field_indent << "\"os_release\"" << separator
        << to_json(distro.os_properties, pretty, 1) << newline;
    oss << "}";
    return oss.str();
}

} // namespace distro_detect::output::json

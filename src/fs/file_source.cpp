//
// distro-detect - File Source Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <fs/file_source.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

namespace distro_detect {

    auto RealFileSource::status(std::filesystem::path const& path) const -> FileStatus {
        std::error_code ec;
        auto st = std::filesystem::status(path, ec);
        if (ec || !std::filesystem::exists(st)) {
            return FileStatus::missing;
        }
        if (std::filesystem::is_directory(st)) {
            return FileStatus::directory;
        }
        return FileStatus::regular;
    }

    auto RealFileSource::open(std::filesystem::path const& path) const
        -> std::expected<std::unique_ptr<std::istream>, std::string> {

        auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
        if (!*file) {
            return std::unexpected(std::format("Failed to open {}: {}",
                                               path.string(), std::strerror(errno)));
        }
        return file;
    }

    auto MemoryFileSource::add_file(std::filesystem::path const& path, std::string contents)
        -> MemoryFileSource& {
        m_files[path.lexically_normal()] = std::move(contents);
        return *this;
    }

    auto MemoryFileSource::add_directory(std::filesystem::path const& path) -> MemoryFileSource& {
        m_directories.insert(path.lexically_normal());
        return *this;
    }

    auto MemoryFileSource::add_unreadable(std::filesystem::path const& path) -> MemoryFileSource& {
        m_unreadable.insert(path.lexically_normal());
        return *this;
    }

    auto MemoryFileSource::status(std::filesystem::path const& path) const -> FileStatus {
        auto normal = path.lexically_normal();
        if (m_directories.contains(normal)) {
            return FileStatus::directory;
        }
        if (m_files.contains(normal) || m_unreadable.contains(normal)) {
            return FileStatus::regular;
        }
        return FileStatus::missing;
    }

    auto MemoryFileSource::open(std::filesystem::path const& path) const
        -> std::expected<std::unique_ptr<std::istream>, std::string> {

        auto normal = path.lexically_normal();
        if (m_unreadable.contains(normal)) {
            return std::unexpected(std::format("Failed to open {}: Permission denied",
                                               normal.string()));
        }

        auto it = m_files.find(normal);
        if (it == m_files.end()) {
            return std::unexpected(std::format("Failed to open {}: No such file or directory",
                                               normal.string()));
        }
        return std::make_unique<std::istringstream>(it->second, std::ios::in | std::ios::binary);
    }

}  // namespace distro_detect

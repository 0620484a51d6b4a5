//
// distro-detect - File Source
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_FS_FILE_SOURCE_H
#define DISTRO_DETECT_FS_FILE_SOURCE_H

#include <cstdint>
#include <expected>
#include <filesystem>
#include <istream>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace distro_detect {

    //
    // What a path refers to, as far as detection cares.
    //
    enum class FileStatus : std::uint8_t {
        missing,     // Does not exist (or cannot be stat'ed)
        directory,   // Exists but is a directory
        regular      // Anything that can be opened for reading
    };

    //
    // File source interface.
    //
    // All file access made during detection goes through a FileSource, so
    // tests can substitute canned contents for the real filesystem:
    // - RealFileSource: the live filesystem
    // - MemoryFileSource: in-memory path to contents table
    //
    class FileSource {
    public:
        virtual ~FileSource() = default;

        //
        // Determine what the path refers to.
        //
        [[nodiscard]] virtual auto status(std::filesystem::path const& path) const
            -> FileStatus = 0;

        //
        // Open a path for binary reading.
        //
        // Postconditions:
        //   - On success: returns a readable stream positioned at the start
        //   - On failure: returns error message describing the failure
        //
        [[nodiscard]] virtual auto open(std::filesystem::path const& path) const
            -> std::expected<std::unique_ptr<std::istream>, std::string> = 0;
    };

    //
    // File source backed by the real filesystem.
    //
    class RealFileSource : public FileSource {
    public:
        [[nodiscard]] auto status(std::filesystem::path const& path) const
            -> FileStatus override;

        [[nodiscard]] auto open(std::filesystem::path const& path) const
            -> std::expected<std::unique_ptr<std::istream>, std::string> override;
    };

    //
    // File source backed by an in-memory table.
    //
    // Used to run detection deterministically against fixed contents.
    // Paths are compared after lexical normalization.
    //
    class MemoryFileSource : public FileSource {
    public:
        //
        // Register a regular file with the given contents.
        //
        auto add_file(std::filesystem::path const& path, std::string contents) -> MemoryFileSource&;

        //
        // Register a directory.
        //
        auto add_directory(std::filesystem::path const& path) -> MemoryFileSource&;

        //
        // Register a file that exists but fails to open.
        //
        auto add_unreadable(std::filesystem::path const& path) -> MemoryFileSource&;

        [[nodiscard]] auto status(std::filesystem::path const& path) const
            -> FileStatus override;

        [[nodiscard]] auto open(std::filesystem::path const& path) const
            -> std::expected<std::unique_ptr<std::istream>, std::string> override;

    private:
        std::map<std::filesystem::path, std::string> m_files;
        std::set<std::filesystem::path> m_directories;
        std::set<std::filesystem::path> m_unreadable;
    };

}  // namespace distro_detect

#endif  // DISTRO_DETECT_FS_FILE_SOURCE_H

//
// distro-detect - Candidate File Resolution
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef DISTRO_DETECT_FS_FILE_RESOLVER_H
#define DISTRO_DETECT_FS_FILE_RESOLVER_H

#include <core/types.h>
#include <fs/file_source.h>

#include <expected>
#include <filesystem>
#include <initializer_list>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace distro_detect {

    //
    // A candidate that resolved to an open stream.
    //
    struct OpenedFile {
        FilePath path;                          // Path after root prefixing
        std::unique_ptr<std::istream> stream;
    };

    //
    // The full contents of a resolved candidate.
    //
    struct ResolvedContents {
        FilePath path;
        std::string contents;
    };

    //
    // Resolves lists of candidate paths against a filesystem root.
    //
    // Every file read made during detection passes through here. The root
    // prefix lets detection run against a mounted image instead of "/".
    //
    class FileResolver {
    public:
        //
        // Preconditions:
        //   - source must outlive the resolver
        //   - root is an absolute path; an empty root means "/"
        //
        explicit FileResolver(FileSource const& source,
                              std::filesystem::path root = "/");

        //
        // Apply the root prefix to an absolute candidate path.
        //
        [[nodiscard]] auto resolve_path(std::string_view candidate) const
            -> std::filesystem::path;

        //
        // Open the first candidate that exists and is not a directory.
        //
        // Candidates are tried in order. Missing paths and directories are
        // skipped. An existing file that fails to open is logged and ends the
        // search.
        //
        // Postconditions:
        //   - On success: returns the resolved path and an open stream
        //   - On failure: returns error message
        //
        [[nodiscard]] auto open_first(std::initializer_list<std::string_view> candidates) const
            -> std::expected<OpenedFile, std::string>;

        //
        // Read the whole of the first candidate that resolves.
        //
        // Returns nullopt when nothing resolves or the read fails; read
        // failures are logged.
        //
        [[nodiscard]] auto read_first(std::initializer_list<std::string_view> candidates) const
            -> std::optional<ResolvedContents>;

        //
        // Check whether any candidate exists as a non-directory.
        //
        [[nodiscard]] auto any_exists(std::initializer_list<std::string_view> candidates) const
            -> bool;

        [[nodiscard]] auto root() const -> std::filesystem::path const& { return m_root; }

        [[nodiscard]] auto source() const -> FileSource const& { return m_source; }

    private:
        FileSource const& m_source;
        std::filesystem::path m_root;
    };

}  // namespace distro_detect

#endif  // DISTRO_DETECT_FS_FILE_RESOLVER_H

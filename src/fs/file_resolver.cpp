//
// distro-detect - Candidate File Resolution Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <fs/file_resolver.h>

#include <systemd/sd-journal.h>

#include <array>
#include <format>

namespace distro_detect {

    namespace {

        // Chunk size for slurping small release files
        constexpr std::size_t READ_CHUNK_SIZE = 4096;

        //
        // Join candidates for diagnostics.
        //
        auto join_candidates(std::initializer_list<std::string_view> candidates) -> std::string {
            std::string joined;
            for (auto const candidate : candidates) {
                if (!joined.empty()) {
                    joined += ", ";
                }
                joined += candidate;
            }
            return joined;
        }

    }  // anonymous namespace

    FileResolver::FileResolver(FileSource const& source, std::filesystem::path root)
        : m_source{source}, m_root{root.empty() ? std::filesystem::path{"/"} : std::move(root)} {
    }

    auto FileResolver::resolve_path(std::string_view candidate) const -> std::filesystem::path {
        std::filesystem::path path{candidate};
        if (m_root == "/") {
            return path;
        }
        return (m_root / path.relative_path()).lexically_normal();
    }

    auto FileResolver::open_first(std::initializer_list<std::string_view> candidates) const
        -> std::expected<OpenedFile, std::string> {

        for (auto const candidate : candidates) {
            auto path = resolve_path(candidate);

            if (m_source.status(path) != FileStatus::regular) {
                continue;
            }

            auto stream = m_source.open(path);
            if (!stream) {
                sd_journal_print(LOG_ERR, "distro-detect: unable to open file (%s): %s",
                                 path.c_str(), stream.error().c_str());
                return std::unexpected(stream.error());
            }

            return OpenedFile{FilePath{std::move(path)}, std::move(*stream)};
        }

        return std::unexpected(std::format("No readable candidate among: {}",
                                           join_candidates(candidates)));
    }

    auto FileResolver::read_first(std::initializer_list<std::string_view> candidates) const
        -> std::optional<ResolvedContents> {

        auto opened = open_first(candidates);
        if (!opened) {
            return std::nullopt;
        }

        auto& stream = *opened->stream;
        std::string contents;
        std::array<char, READ_CHUNK_SIZE> buffer{};

        while (stream) {
            stream.read(buffer.data(), buffer.size());
            auto bytes_read = static_cast<std::size_t>(stream.gcount());
            if (bytes_read > 0) {
                contents.append(buffer.data(), bytes_read);
            }
        }

        if (stream.bad()) {
            sd_journal_print(LOG_ERR, "distro-detect: unable to read file (%s)",
                             (*opened->path).c_str());
            return std::nullopt;
        }

        return ResolvedContents{std::move(opened->path), std::move(contents)};
    }

    auto FileResolver::any_exists(std::initializer_list<std::string_view> candidates) const
        -> bool {
        for (auto const candidate : candidates) {
            if (m_source.status(resolve_path(candidate)) == FileStatus::regular) {
                return true;
            }
        }
        return false;
    }

}  // namespace distro_detect

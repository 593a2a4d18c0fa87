// Copyright 2022 Huawei Cloud Computing Technology Co., Ltd.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "src/relpack/archive/archive_ops.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <fstream>
#include <memory>

#include "gsl/gsl"
#include "src/relpack/file_system/file_system_manager.hpp"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/logger.hpp"

extern "C" {
#include <archive.h>
#include <archive_entry.h>
}

namespace {

/// \brief Default block size for archive reading.
constexpr std::size_t kArchiveBlockSize = 10240;

/// \brief Chunk size for streaming file content into an archive.
constexpr std::size_t kWriteChunkSize = 64 * 1024;

/// \brief Clean-up function for archive entry objects.
void archive_entry_cleanup(archive_entry* entry) {
    if (entry != nullptr) {
        archive_entry_free(entry);
    }
}

/// \brief Clean-up function for archive objects open for writing.
void archive_write_closer(archive* a_out) {
    if (a_out != nullptr) {
        archive_write_close(a_out);  // libarchive handles non-openness
        archive_write_free(a_out);   // also do cleanup!
    }
}

/// \brief Clean-up function for archive objects open for reading.
void archive_read_closer(archive* a_in) {
    if (a_in != nullptr) {
        archive_read_close(a_in);  // libarchive handles non-openness
        archive_read_free(a_in);   // also do cleanup!
    }
}

[[nodiscard]] auto ErrorOf(archive* a) -> std::string {
    auto const* msg = archive_error_string(a);
    return std::string("ArchiveOps: ") +
           (msg != nullptr ? std::string(msg) : std::string("unknown error"));
}

}  // namespace

auto ArchiveOps::EnableWriteFormats(archive* aw, ArchiveType type)
    -> std::optional<std::string> {
    if (archive_write_set_format_pax_restricted(aw) != ARCHIVE_OK) {
        return ErrorOf(aw);
    }
    switch (type) {
        case ArchiveType::Tar:
            break;  // no compression filter
        case ArchiveType::TarGz:
            if (archive_write_add_filter_gzip(aw) != ARCHIVE_OK) {
                return ErrorOf(aw);
            }
            break;
    }
    return std::nullopt;  // success!
}

auto ArchiveOps::WriteFileData(std::filesystem::path const& file, archive* aw)
    -> std::optional<std::string> {
    std::ifstream in{file, std::ios::binary};
    if (not in.is_open()) {
        return "ArchiveOps: failed to open file entry " + file.string();
    }
    std::array<char, kWriteChunkSize> chunk{};
    while (in) {
        in.read(chunk.data(), gsl::narrow<std::streamsize>(chunk.size()));
        auto const count = gsl::narrow<std::size_t>(in.gcount());
        if (count > 0 and
            archive_write_data(aw, chunk.data(), count) !=
                gsl::narrow<la_ssize_t>(count)) {
            return ErrorOf(aw);
        }
    }
    if (in.bad()) {
        return "ArchiveOps: failed reading file entry " + file.string();
    }
    return std::nullopt;
}

auto ArchiveOps::CreateArchiveImpl(ArchiveType type,
                                   std::filesystem::path const& source,
                                   std::filesystem::path const& archive_path,
                                   gsl::not_null<bool*> const& opened)
    -> std::optional<std::string> {
    if (not FileSystemManager::IsDirectory(source)) {
        return "ArchiveOps: source is not a directory: " + source.string();
    }

    // collect entries up front, so the archive layout is deterministic
    std::vector<std::filesystem::path> entries{};
    for (auto const& entry :
         std::filesystem::recursive_directory_iterator{source}) {
        entries.emplace_back(entry.path());
    }
    std::sort(entries.begin(), entries.end());

    std::unique_ptr<archive, decltype(&archive_write_closer)> a_out{
        archive_write_new(), archive_write_closer};
    if (a_out == nullptr) {
        return std::string("ArchiveOps: archive_write_new failed");
    }
    if (auto res = EnableWriteFormats(a_out.get(), type)) {
        return *res;
    }
    auto const parent = archive_path.parent_path();
    if (not parent.empty() and not FileSystemManager::CreateDirectory(parent)) {
        return "ArchiveOps: could not create destination directory " +
               parent.string();
    }
    if (archive_write_open_filename(a_out.get(), archive_path.c_str()) !=
        ARCHIVE_OK) {
        return ErrorOf(a_out.get());
    }
    *opened = true;

    // used only to fill entry metadata from the files on disk
    std::unique_ptr<archive, decltype(&archive_read_closer)> disk{
        archive_read_disk_new(), archive_read_closer};
    if (disk == nullptr) {
        return std::string("ArchiveOps: archive_read_disk_new failed");
    }
    archive_read_disk_set_standard_lookup(disk.get());

    for (auto const& path : entries) {
        std::unique_ptr<archive_entry, decltype(&archive_entry_cleanup)> entry{
            archive_entry_new(), archive_entry_cleanup};
        if (entry == nullptr) {
            return std::string("ArchiveOps: archive_entry_new failed");
        }
        archive_entry_copy_sourcepath(entry.get(), path.c_str());
        if (archive_read_disk_entry_from_file(
                disk.get(), entry.get(), -1, nullptr) != ARCHIVE_OK) {
            return ErrorOf(disk.get());
        }
        auto const rel_path = path.lexically_relative(source);
        archive_entry_copy_pathname(entry.get(), rel_path.c_str());
        if (archive_write_header(a_out.get(), entry.get()) != ARCHIVE_OK) {
            return ErrorOf(a_out.get());
        }
        if (FileSystemManager::IsFile(path)) {
            if (auto res = WriteFileData(path, a_out.get())) {
                return *res;
            }
        }
    }
    if (archive_write_close(a_out.get()) != ARCHIVE_OK) {
        return ErrorOf(a_out.get());
    }
    return std::nullopt;  // success!
}

auto ArchiveOps::CreateArchive(
    ArchiveType type,
    std::filesystem::path const& source,
    std::filesystem::path const& archive_path) noexcept
    -> std::optional<std::string> {
    std::optional<std::string> res{};
    bool opened{false};
    try {
        res = CreateArchiveImpl(type, source, archive_path, &opened);
    } catch (std::exception const& ex) {
        res = std::string("ArchiveOps: archive create failed with:\n") +
              ex.what();
    }
    if (res and opened and not FileSystemManager::RemoveFile(archive_path)) {
        Logger::Log(LogLevel::Warning,
                    "could not remove partial archive {}",
                    archive_path.string());
    }
    return res;
}

auto ArchiveOps::ListEntries(std::filesystem::path const& archive_path) noexcept
    -> expected<std::vector<std::string>, std::string> {
    try {
        std::unique_ptr<archive, decltype(&archive_read_closer)> a_in{
            archive_read_new(), archive_read_closer};
        if (a_in == nullptr) {
            return unexpected<std::string>{"ArchiveOps: archive_read_new failed"};
        }
        if (archive_read_support_format_tar(a_in.get()) != ARCHIVE_OK or
            archive_read_support_filter_all(a_in.get()) != ARCHIVE_OK) {
            return unexpected{ErrorOf(a_in.get())};
        }
        if (archive_read_open_filename(a_in.get(),
                                       archive_path.c_str(),
                                       kArchiveBlockSize) != ARCHIVE_OK) {
            return unexpected{ErrorOf(a_in.get())};
        }
        std::vector<std::string> names{};
        archive_entry* entry{nullptr};
        while (true) {
            int r = archive_read_next_header(a_in.get(), &entry);
            if (r == ARCHIVE_EOF) {
                return names;
            }
            if (r != ARCHIVE_OK) {
                return unexpected{ErrorOf(a_in.get())};
            }
            names.emplace_back(archive_entry_pathname(entry));
            if (archive_read_data_skip(a_in.get()) != ARCHIVE_OK) {
                return unexpected{ErrorOf(a_in.get())};
            }
        }
    } catch (std::exception const& ex) {
        return unexpected{
            std::string("ArchiveOps: listing archive failed with:\n") +
            ex.what()};
    }
}

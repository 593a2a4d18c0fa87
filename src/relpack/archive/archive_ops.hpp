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

#ifndef INCLUDED_SRC_RELPACK_ARCHIVE_ARCHIVE_OPS_HPP
#define INCLUDED_SRC_RELPACK_ARCHIVE_ARCHIVE_OPS_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "gsl/gsl"
#include "src/utils/cpp/expected.hpp"

extern "C" {
using archive = struct archive;
using archive_entry = struct archive_entry;
}

enum class ArchiveType : std::size_t {
    Tar,   // uncompressed
    TarGz  // gzip compressed
};

/// \brief Class handling tarball creation and inspection via libarchive
class ArchiveOps {
  public:
    /// \brief Create archive of given type containing the content of the
    /// source directory. Entry names are relative to source, without a
    /// leading "./", and are written in sorted order. The parent directory of
    /// the archive is created if missing; a partially written archive is
    /// removed on failure.
    /// Returns nullopt on success, or an error string if failure.
    [[nodiscard]] static auto CreateArchive(
        ArchiveType type,
        std::filesystem::path const& source,
        std::filesystem::path const& archive_path) noexcept
        -> std::optional<std::string>;

    /// \brief List the entry names of a tarball (any supported compression).
    [[nodiscard]] static auto ListEntries(
        std::filesystem::path const& archive_path) noexcept
        -> expected<std::vector<std::string>, std::string>;

  private:
    /// \brief Stream the content of a regular file into the archive.
    /// Returns nullopt on success, or an error string if failure.
    [[nodiscard]] static auto WriteFileData(std::filesystem::path const& file,
                                            archive* aw)
        -> std::optional<std::string>;

    /// \brief Set up the appropriate supported format for writing an archive.
    /// Returns nullopt on success, or an error string if failure.
    [[nodiscard]] static auto EnableWriteFormats(archive* aw, ArchiveType type)
        -> std::optional<std::string>;

    [[nodiscard]] static auto CreateArchiveImpl(
        ArchiveType type,
        std::filesystem::path const& source,
        std::filesystem::path const& archive_path,
        gsl::not_null<bool*> const& opened) -> std::optional<std::string>;
};

#endif  // INCLUDED_SRC_RELPACK_ARCHIVE_ARCHIVE_OPS_HPP

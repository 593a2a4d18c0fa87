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

#ifndef INCLUDED_SRC_RELPACK_VERSIONS_LOCAL_VERSION_STORAGE_HPP
#define INCLUDED_SRC_RELPACK_VERSIONS_LOCAL_VERSION_STORAGE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "src/utils/cpp/expected.hpp"

/// \brief Directory cache of artifact tarballs, keyed by blobstore id.
/// Entries are written through a unique temporary file and an atomic rename,
/// so concurrent writers of the same id resolve to last-writer-wins.
class LocalVersionStorage {
  public:
    explicit LocalVersionStorage(std::filesystem::path storage_root) noexcept
        : storage_root_{std::move(storage_root)} {}

    [[nodiscard]] auto StorageRoot() const& noexcept
        -> std::filesystem::path const& {
        return storage_root_;
    }

    /// \brief Path of the cached entry, if present.
    [[nodiscard]] auto Lookup(std::string const& id) const noexcept
        -> std::optional<std::filesystem::path>;

    /// \brief Store bytes under the given id.
    /// \returns path of the stored entry or an error message.
    [[nodiscard]] auto Store(std::string const& id,
                             std::string const& bytes) const noexcept
        -> expected<std::filesystem::path, std::string>;

    /// \brief An id must be usable as a plain file name.
    [[nodiscard]] static auto IsValidId(std::string const& id) noexcept -> bool;

  private:
    std::filesystem::path storage_root_;
};

#endif  // INCLUDED_SRC_RELPACK_VERSIONS_LOCAL_VERSION_STORAGE_HPP

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

#ifndef INCLUDED_SRC_RELPACK_VERSIONS_VERSION_INDEX_HPP
#define INCLUDED_SRC_RELPACK_VERSIONS_VERSION_INDEX_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"
#include "src/relpack/versions/version_record.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Read-only view of the builds recorded for one artifact name, e.g.,
/// \p .final_builds/packages/<name>/index.json. Records keep the order in
/// which they appear in the file, so lookups are first-match deterministic.
/// The index directory also hosts the artifact's local version storage.
class VersionIndex {
  public:
    using RecordPredicate = std::function<bool(VersionRecord const&)>;

    static constexpr auto kIndexFileName = "index.json";

    /// \brief Load the index stored in the given directory. A missing index
    /// file yields an empty index; a malformed one yields an error message.
    [[nodiscard]] static auto Load(std::filesystem::path const& dir) noexcept
        -> expected<VersionIndex, std::string>;

    /// \brief Build an index from already parsed JSON of the form
    /// {"builds": {"<key>": {"version":..., "sha1":..., "blobstore_id":...}}}.
    [[nodiscard]] static auto FromJson(nlohmann::ordered_json const& json,
                                       std::filesystem::path dir) noexcept
        -> expected<VersionIndex, std::string>;

    [[nodiscard]] auto Directory() const& noexcept
        -> std::filesystem::path const& {
        return dir_;
    }

    [[nodiscard]] auto Records() const& noexcept
        -> std::vector<VersionRecord> const& {
        return records_;
    }

    [[nodiscard]] auto Empty() const noexcept -> bool {
        return records_.empty();
    }

    /// \brief All records satisfying the predicate, in index order.
    [[nodiscard]] auto Select(RecordPredicate const& predicate) const
        -> std::vector<VersionRecord>;

    /// \brief First record whose sha1 equals the given checksum.
    [[nodiscard]] auto FindBySha1(std::string const& sha1) const
        -> std::optional<VersionRecord>;

  private:
    std::filesystem::path dir_;
    std::vector<VersionRecord> records_;

    VersionIndex(std::filesystem::path dir,
                 std::vector<VersionRecord> records) noexcept
        : dir_{std::move(dir)}, records_{std::move(records)} {}
};

#endif  // INCLUDED_SRC_RELPACK_VERSIONS_VERSION_INDEX_HPP

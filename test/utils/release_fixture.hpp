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

#ifndef INCLUDED_SRC_TEST_UTILS_RELEASE_FIXTURE_HPP
#define INCLUDED_SRC_TEST_UTILS_RELEASE_FIXTURE_HPP

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "nlohmann/json.hpp"
#include "src/relpack/blobstore/blobstore_client.hpp"
#include "src/relpack/crypto/hasher.hpp"
#include "src/relpack/file_system/file_system_manager.hpp"
#include "src/relpack/release/artifact.hpp"
#include "src/relpack/release/artifact_locator.hpp"
#include "src/relpack/versions/version_index.hpp"
#include "src/utils/cpp/tmp_dir.hpp"
#include "test/utils/test_env.hpp"

/// \brief In-memory blobstore counting the fetches it serves.
class FakeBlobstoreClient final : public IBlobstoreClient {
  public:
    void Put(std::string const& id, std::string content) {
        blobs_[id] = std::move(content);
    }

    /// \brief Make every subsequent fetch fail as unreachable.
    void SetUnreachable(bool unreachable) noexcept {
        unreachable_ = unreachable;
    }

    [[nodiscard]] auto Fetch(std::string const& id) noexcept
        -> expected<std::string, BlobstoreFetchError> final {
        ++fetches_;
        if (unreachable_) {
            return unexpected{BlobstoreFetchError{
                .kind = BlobstoreFetchError::Kind::Transport,
                .message = "connection refused"}};
        }
        auto it = blobs_.find(id);
        if (it == blobs_.end()) {
            return unexpected{
                BlobstoreFetchError{.kind = BlobstoreFetchError::Kind::NotFound,
                                    .message = "no such object " + id}};
        }
        return it->second;
    }

    [[nodiscard]] auto Describe() const -> std::string final {
        return "fake blobstore";
    }

    [[nodiscard]] auto Fetches() const noexcept -> int { return fetches_; }

  private:
    std::map<std::string, std::string> blobs_;
    std::atomic<int> fetches_{};
    bool unreachable_{false};
};

[[nodiscard]] static inline auto Sha1Of(std::string const& content)
    -> std::string {
    auto digest = Hasher::HashData(Hasher::HashType::SHA1, content);
    REQUIRE(digest);
    return *digest;
}

/// \brief A release directory in a fresh temporary location, with helpers to
/// populate its builds trees and blobstore.
class ReleaseFixture {
  public:
    ReleaseFixture()
        : root_{TmpDir::Create(GetTestTmpDir(), "release-src")},
          blobstore_{std::make_shared<FakeBlobstoreClient>()} {
        REQUIRE(root_ != nullptr);
    }

    [[nodiscard]] auto ReleaseDir() const -> std::filesystem::path const& {
        return root_->GetPath();
    }

    [[nodiscard]] auto Blobstore() const
        -> std::shared_ptr<FakeBlobstoreClient> const& {
        return blobstore_;
    }

    [[nodiscard]] auto IndexDir(ArtifactLocator::Tier tier,
                                ArtifactKind kind,
                                std::string const& name) const
        -> std::filesystem::path {
        return ArtifactLocator{ReleaseDir(), nullptr}.IndexDirectory(
            tier, kind, name);
    }

    /// \brief Record a build in an index. The content is put into the
    /// blobstore, and additionally into the local storage if cached is set.
    /// \returns sha1 of the content.
    auto AddBuild(ArtifactLocator::Tier tier,
                  ArtifactKind kind,
                  std::string const& name,
                  std::string const& version,
                  std::string const& content,
                  std::string const& blobstore_id,
                  bool cached = false) -> std::string {
        auto sha1 = Sha1Of(content);
        auto dir = IndexDir(tier, kind, name);
        auto& index = indices_[dir];
        if (index.is_null()) {
            index = nlohmann::ordered_json{
                {"builds", nlohmann::ordered_json::object()}};
        }
        index["builds"][sha1 + "-" + version] = {
            {"version", version}, {"sha1", sha1}, {"blobstore_id", blobstore_id}};
        REQUIRE(FileSystemManager::WriteFile(
            index.dump(2), dir / VersionIndex::kIndexFileName));
        blobstore_->Put(blobstore_id, content);
        if (cached) {
            REQUIRE(FileSystemManager::WriteFile(content, dir / blobstore_id));
        }
        return sha1;
    }

    /// \brief Write a manifest file relative to the release directory.
    auto WriteManifest(std::filesystem::path const& relative,
                       nlohmann::json const& manifest) const
        -> std::filesystem::path {
        auto path = ReleaseDir() / relative;
        REQUIRE(FileSystemManager::WriteFile(manifest.dump(2), path));
        return path;
    }

  private:
    TmpDir::Ptr root_;
    std::shared_ptr<FakeBlobstoreClient> blobstore_;
    std::map<std::filesystem::path, nlohmann::ordered_json> indices_;
};

#endif  // INCLUDED_SRC_TEST_UTILS_RELEASE_FIXTURE_HPP

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

#ifndef INCLUDED_SRC_RELPACK_RELEASE_ARTIFACT_LOCATOR_HPP
#define INCLUDED_SRC_RELPACK_RELEASE_ARTIFACT_LOCATOR_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

#include "src/relpack/blobstore/blobstore_client.hpp"
#include "src/relpack/release/artifact.hpp"
#include "src/relpack/release/compile_error.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Resolves a requested artifact to a verified local tarball.
///
/// The final builds tree is searched before the dev builds tree; within a
/// tree the first index record with a matching sha1 wins. The winning
/// record's blob is taken from the local version storage next to its index,
/// or fetched from the blobstore, verified, and cached there.
class ArtifactLocator {
  public:
    enum class Tier : std::uint8_t { Final, Dev };

    static constexpr auto kFinalBuildsDir = ".final_builds";
    static constexpr auto kDevBuildsDir = ".dev_builds";

    ArtifactLocator(std::filesystem::path release_dir,
                    IBlobstoreClient::Ptr blobstore) noexcept
        : release_dir_{std::move(release_dir)},
          blobstore_{std::move(blobstore)} {}

    [[nodiscard]] auto Locate(ArtifactKind kind,
                              std::string const& name,
                              std::string const& version,
                              std::string const& sha1) const noexcept
        -> expected<std::filesystem::path, CompileError>;

    [[nodiscard]] auto Locate(ArtifactKind kind,
                              ArtifactDescriptor const& artifact) const noexcept
        -> expected<std::filesystem::path, CompileError> {
        return Locate(kind, artifact.name, artifact.version, artifact.sha1);
    }

    /// \brief Directory holding index and local storage of an artifact,
    /// e.g., <release>/.dev_builds/packages/<name>.
    [[nodiscard]] auto IndexDirectory(Tier tier,
                                      ArtifactKind kind,
                                      std::string const& name) const
        -> std::filesystem::path;

  private:
    std::filesystem::path release_dir_;
    IBlobstoreClient::Ptr blobstore_;

    /// \brief Take the blob from local storage or fetch and cache it.
    [[nodiscard]] auto ResolveBlob(std::filesystem::path const& storage_dir,
                                   std::string const& blobstore_id,
                                   std::string const& sha1,
                                   std::string const& desc) const
        -> expected<std::filesystem::path, CompileError>;
};

#endif  // INCLUDED_SRC_RELPACK_RELEASE_ARTIFACT_LOCATOR_HPP

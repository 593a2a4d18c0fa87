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

#ifndef INCLUDED_SRC_RELPACK_RELEASE_RELEASE_COMPILER_HPP
#define INCLUDED_SRC_RELPACK_RELEASE_RELEASE_COMPILER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "src/relpack/blobstore/blobstore_client.hpp"
#include "src/relpack/release/artifact.hpp"
#include "src/relpack/release/artifact_locator.hpp"
#include "src/relpack/release/compile_error.hpp"
#include "src/relpack/release/release_manifest.hpp"
#include "src/utils/cpp/expected.hpp"
#include "src/utils/cpp/tmp_dir.hpp"

struct CompileResult {
    enum class Status : std::uint8_t {
        Built,         ///< A new tarball was written.
        AlreadyExists  ///< The tarball was present already; nothing was done.
    };
    Status status{Status::Built};
    std::filesystem::path tarball_path{};
    std::uintmax_t size{};
    std::vector<std::string> copied_packages{};
    std::vector<std::string> copied_jobs{};
    std::vector<std::string> skipped_packages{};
};

/// \brief Assembles a release tarball from a manifest.
///
/// Every package and job of the manifest is resolved to a local tarball and
/// staged, together with a copy of the manifest as release.MF, in a private
/// staging directory which is removed with the compiler. Packages whose
/// checksum or fingerprint the destination already knows are left out.
class ReleaseCompiler {
  public:
    static constexpr auto kManifestName = "release.MF";

    /// \brief Load the manifest and create the staging directory.
    /// \param manifest_file    Manifest, relative to the release source.
    /// \param blobstore        Store to fetch artifacts not cached locally.
    /// \param package_matches  Checksums of packages known to the destination.
    /// \param release_source   Release directory, defaults to the current one.
    /// \param tmp_root         Where to create the staging directory, defaults
    ///                         to the system's temporary directory.
    [[nodiscard]] static auto Create(
        std::filesystem::path const& manifest_file,
        IBlobstoreClient::Ptr blobstore,
        std::vector<std::string> const& package_matches = {},
        std::optional<std::filesystem::path> const& release_source =
            std::nullopt,
        std::optional<std::filesystem::path> const& tmp_root =
            std::nullopt) noexcept -> expected<ReleaseCompiler, CompileError>;

    /// \brief Compile with no known packages, from the current directory.
    [[nodiscard]] static auto Compile(std::filesystem::path const& manifest_file,
                                      IBlobstoreClient::Ptr blobstore) noexcept
        -> expected<CompileResult, CompileError>;

    /// \brief Build the tarball unless it exists already.
    [[nodiscard]] auto Compile() noexcept
        -> expected<CompileResult, CompileError>;

    /// \brief Override the default tarball location.
    void SetTarballPath(std::filesystem::path const& path) noexcept;

    /// \brief Configured tarball path, or "<name>-<version>.tgz" next to the
    /// manifest.
    [[nodiscard]] auto TarballPath() const -> std::filesystem::path;

    /// \brief Whether the tarball is present. Not cached.
    [[nodiscard]] auto Exists() const noexcept -> bool;

    [[nodiscard]] auto RemotePackageExists(
        ArtifactDescriptor const& package) const -> bool;

    /// \brief Jobs are never considered known to the destination.
    [[nodiscard]] auto RemoteJobExists(ArtifactDescriptor const& job) const
        -> bool;

    [[nodiscard]] auto Manifest() const& noexcept -> ReleaseManifest const& {
        return manifest_;
    }

    [[nodiscard]] auto StagingDirectory() const& noexcept
        -> std::filesystem::path const& {
        return build_dir_->GetPath();
    }

  private:
    std::filesystem::path manifest_file_;
    ReleaseManifest manifest_;
    ArtifactLocator locator_;
    std::unordered_set<std::string> package_matches_;
    TmpDir::Ptr build_dir_;
    std::optional<std::filesystem::path> tarball_path_{};

    ReleaseCompiler(std::filesystem::path manifest_file,
                    ReleaseManifest manifest,
                    ArtifactLocator locator,
                    std::unordered_set<std::string> package_matches,
                    TmpDir::Ptr build_dir) noexcept;

    /// \brief Resolve and stage all artifacts of one kind.
    [[nodiscard]] auto CopyArtifacts(
        ArtifactKind kind,
        std::vector<ArtifactDescriptor> const& artifacts,
        gsl::not_null<std::vector<std::string>*> const& copied,
        gsl::not_null<std::vector<std::string>*> const& skipped) const
        -> std::optional<CompileError>;
};

#endif  // INCLUDED_SRC_RELPACK_RELEASE_RELEASE_COMPILER_HPP

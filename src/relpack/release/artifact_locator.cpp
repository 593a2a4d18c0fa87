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

#include "src/relpack/release/artifact_locator.hpp"

#include <exception>
#include <optional>

#include "fmt/core.h"
#include "src/relpack/crypto/hasher.hpp"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/logger.hpp"
#include "src/relpack/versions/local_version_storage.hpp"
#include "src/relpack/versions/version_index.hpp"
#include "src/utils/cpp/hex_string.hpp"

namespace {

[[nodiscard]] auto TierName(ArtifactLocator::Tier tier) -> std::string {
    return tier == ArtifactLocator::Tier::Final ? "final" : "dev";
}

[[nodiscard]] auto SameChecksum(std::string const& lhs,
                                std::string const& rhs) -> bool {
    return NormalizeHexString(lhs) == NormalizeHexString(rhs);
}

}  // namespace

auto ArtifactLocator::IndexDirectory(Tier tier,
                                     ArtifactKind kind,
                                     std::string const& name) const
    -> std::filesystem::path {
    auto const* builds_dir =
        tier == Tier::Final ? kFinalBuildsDir : kDevBuildsDir;
    return release_dir_ / builds_dir / ToBuildsDirName(kind) / name;
}

auto ArtifactLocator::Locate(ArtifactKind kind,
                             std::string const& name,
                             std::string const& version,
                             std::string const& sha1) const noexcept
    -> expected<std::filesystem::path, CompileError> {
    try {
        auto const desc = fmt::format("{} {} ({})", ToString(kind), name, version);
        if (not IsValidArtifactName(name)) {
            return unexpected{
                CompileError{.kind = CompileErrorKind::InvalidManifest,
                             .message = fmt::format("Invalid {} name \"{}\"",
                                                    ToString(kind),
                                                    name)}};
        }

        for (auto tier : {Tier::Final, Tier::Dev}) {
            auto index = VersionIndex::Load(IndexDirectory(tier, kind, name));
            if (not index) {
                return unexpected{
                    CompileError{.kind = CompileErrorKind::InvalidIndex,
                                 .message = std::move(index).error()}};
            }
            auto record = index->FindBySha1(sha1);
            if (not record) {
                continue;
            }
            Logger::Log(LogLevel::Debug,
                        "Found {} in {} index as build {}",
                        desc,
                        TierName(tier),
                        record->key);
            if (not record->blobstore_id) {
                return unexpected{CompileError{
                    .kind = CompileErrorKind::InvalidIndex,
                    .message = fmt::format(
                        "Build {} of {} in {} has no blobstore id",
                        record->key,
                        desc,
                        index->Directory().string())}};
            }
            return ResolveBlob(
                index->Directory(), *record->blobstore_id, sha1, desc);
        }

        return unexpected{CompileError{
            .kind = CompileErrorKind::ArtifactNotFound,
            .message = fmt::format("Cannot find {} {} with checksum `{}'",
                                   ToString(kind),
                                   name,
                                   sha1)}};
    } catch (std::exception const& ex) {
        return unexpected{CompileError{
            .kind = CompileErrorKind::InvalidIndex,
            .message = fmt::format("Locating {} {} failed with:\n{}",
                                   ToString(kind),
                                   name,
                                   ex.what())}};
    }
}

auto ArtifactLocator::ResolveBlob(std::filesystem::path const& storage_dir,
                                  std::string const& blobstore_id,
                                  std::string const& sha1,
                                  std::string const& desc) const
    -> expected<std::filesystem::path, CompileError> {
    LocalVersionStorage storage{storage_dir};

    if (auto cached = storage.Lookup(blobstore_id)) {
        auto actual = Hasher::HashFile(Hasher::HashType::SHA1, *cached);
        if (not actual or not SameChecksum(*actual, sha1)) {
            return unexpected{CompileError{
                .kind = CompileErrorKind::ChecksumMismatch,
                .message = fmt::format(
                    "Local copy of {} at {} is corrupted: expected sha1 {}, "
                    "got {}",
                    desc,
                    cached->string(),
                    sha1,
                    actual.value_or("<unreadable>"))}};
        }
        return *cached;
    }

    if (blobstore_ == nullptr) {
        return unexpected{CompileError{
            .kind = CompileErrorKind::BlobstoreError,
            .message = fmt::format(
                "Blobstore error: no blobstore configured to fetch {}", desc)}};
    }
    Logger::Log(LogLevel::Progress,
                "Downloading {} (blob {}) from {}",
                desc,
                blobstore_id,
                blobstore_->Describe());
    auto content = blobstore_->Fetch(blobstore_id);
    if (not content) {
        return unexpected{
            CompileError{.kind = CompileErrorKind::BlobstoreError,
                         .message = fmt::format("Blobstore error: {}",
                                                content.error().message)}};
    }

    auto actual = Hasher::HashData(Hasher::HashType::SHA1, *content);
    if (not actual or not SameChecksum(*actual, sha1)) {
        return unexpected{CompileError{
            .kind = CompileErrorKind::ChecksumMismatch,
            .message = fmt::format(
                "Checksum mismatch for {} (blob {}): expected {}, got {}",
                desc,
                blobstore_id,
                sha1,
                actual.value_or("<unavailable>"))}};
    }

    auto stored = storage.Store(blobstore_id, *content);
    if (not stored) {
        return unexpected{
            CompileError{.kind = CompileErrorKind::StagingFailed,
                         .message = fmt::format("Caching {} failed: {}",
                                                desc,
                                                stored.error())}};
    }
    return *std::move(stored);
}

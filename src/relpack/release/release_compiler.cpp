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

#include "src/relpack/release/release_compiler.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/relpack/archive/archive_ops.hpp"
#include "src/relpack/file_system/file_system_manager.hpp"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/logger.hpp"
#include "src/utils/cpp/hex_string.hpp"
#include "src/utils/cpp/pretty_size.hpp"

namespace {

constexpr std::size_t kArtifactColumnWidth = 30;

[[nodiscard]] auto ArtifactLine(ArtifactDescriptor const& artifact,
                                std::string const& outcome) -> std::string {
    return fmt::format("{:<{}} {}",
                       fmt::format("{} ({})", artifact.name, artifact.version),
                       kArtifactColumnWidth,
                       outcome);
}

[[nodiscard]] auto StagingError(std::string message) -> CompileError {
    return CompileError{.kind = CompileErrorKind::StagingFailed,
                        .message = std::move(message)};
}

}  // namespace

ReleaseCompiler::ReleaseCompiler(
    std::filesystem::path manifest_file,
    ReleaseManifest manifest,
    ArtifactLocator locator,
    std::unordered_set<std::string> package_matches,
    TmpDir::Ptr build_dir) noexcept
    : manifest_file_{std::move(manifest_file)},
      manifest_{std::move(manifest)},
      locator_{std::move(locator)},
      package_matches_{std::move(package_matches)},
      build_dir_{std::move(build_dir)} {}

auto ReleaseCompiler::Create(
    std::filesystem::path const& manifest_file,
    IBlobstoreClient::Ptr blobstore,
    std::vector<std::string> const& package_matches,
    std::optional<std::filesystem::path> const& release_source,
    std::optional<std::filesystem::path> const& tmp_root) noexcept
    -> expected<ReleaseCompiler, CompileError> {
    try {
        auto source_dir = std::filesystem::absolute(
            release_source.value_or(FileSystemManager::GetCurrentDirectory()));
        auto manifest_path =
            (source_dir / manifest_file).lexically_normal();

        auto build_dir = TmpDir::Create(
            tmp_root.value_or(std::filesystem::temp_directory_path()),
            "release");
        if (build_dir == nullptr) {
            return unexpected{
                StagingError("Cannot create release staging directory")};
        }
        for (auto kind : {ArtifactKind::Package, ArtifactKind::Job}) {
            auto dir = build_dir->GetPath() / ToBuildsDirName(kind);
            if (not FileSystemManager::CreateDirectory(dir)) {
                return unexpected{StagingError(fmt::format(
                    "Cannot create staging directory {}", dir.string()))};
            }
        }

        auto manifest = ReleaseManifest::Load(manifest_path);
        if (not manifest) {
            return unexpected{
                CompileError{.kind = CompileErrorKind::InvalidManifest,
                             .message = std::move(manifest).error()}};
        }

        std::unordered_set<std::string> matches{};
        std::transform(package_matches.begin(),
                       package_matches.end(),
                       std::inserter(matches, matches.end()),
                       NormalizeHexString);
        return ReleaseCompiler{
            std::move(manifest_path),
            *std::move(manifest),
            ArtifactLocator{std::move(source_dir), std::move(blobstore)},
            std::move(matches),
            std::move(build_dir)};
    } catch (std::exception const& ex) {
        return unexpected{StagingError(fmt::format(
            "Setting up release compilation failed with:\n{}", ex.what()))};
    }
}

auto ReleaseCompiler::Compile(std::filesystem::path const& manifest_file,
                              IBlobstoreClient::Ptr blobstore) noexcept
    -> expected<CompileResult, CompileError> {
    auto compiler = Create(manifest_file, std::move(blobstore));
    if (not compiler) {
        return unexpected{std::move(compiler).error()};
    }
    return compiler->Compile();
}

void ReleaseCompiler::SetTarballPath(std::filesystem::path const& path) noexcept {
    try {
        tarball_path_ = std::filesystem::absolute(path);
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Warning,
                    "Cannot make tarball path {} absolute:\n{}",
                    path.string(),
                    ex.what());
        tarball_path_ = path;
    }
}

auto ReleaseCompiler::TarballPath() const -> std::filesystem::path {
    if (tarball_path_) {
        return *tarball_path_;
    }
    return manifest_file_.parent_path() / manifest_.TarballName();
}

auto ReleaseCompiler::Exists() const noexcept -> bool {
    try {
        return FileSystemManager::Exists(TarballPath());
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error,
                    "Checking for existing tarball failed with:\n{}",
                    ex.what());
        return false;
    }
}

auto ReleaseCompiler::RemotePackageExists(
    ArtifactDescriptor const& package) const -> bool {
    // a checksum known to the destination can always be matched
    if (package_matches_.contains(NormalizeHexString(package.sha1))) {
        return true;
    }
    return package.fingerprint and
           package_matches_.contains(NormalizeHexString(*package.fingerprint));
}

auto ReleaseCompiler::RemoteJobExists(
    ArtifactDescriptor const& /*job*/) const -> bool {
    return false;
}

auto ReleaseCompiler::CopyArtifacts(
    ArtifactKind kind,
    std::vector<ArtifactDescriptor> const& artifacts,
    gsl::not_null<std::vector<std::string>*> const& copied,
    gsl::not_null<std::vector<std::string>*> const& skipped) const
    -> std::optional<CompileError> {
    auto const target_dir = build_dir_->GetPath() / ToBuildsDirName(kind);
    for (auto const& artifact : artifacts) {
        bool const known = kind == ArtifactKind::Package
                               ? RemotePackageExists(artifact)
                               : RemoteJobExists(artifact);
        if (known) {
            Logger::Log(LogLevel::Info, ArtifactLine(artifact, "SKIP"));
            skipped->emplace_back(artifact.name);
            continue;
        }
        auto file = locator_.Locate(kind, artifact);
        if (not file) {
            if (file.error().kind == CompileErrorKind::ArtifactNotFound) {
                Logger::Log(LogLevel::Info, ArtifactLine(artifact, "MISSING"));
            }
            return std::move(file).error();
        }
        auto const target = target_dir / (artifact.name + ".tgz");
        if (not FileSystemManager::CopyFile(*file, target)) {
            return StagingError(fmt::format("Cannot copy {} to {}",
                                            file->string(),
                                            target.string()));
        }
        Logger::Log(LogLevel::Info, ArtifactLine(artifact, "copied"));
        copied->emplace_back(artifact.name);
    }
    return std::nullopt;
}

auto ReleaseCompiler::Compile() noexcept
    -> expected<CompileResult, CompileError> {
    try {
        auto const tarball = TarballPath();
        if (Exists()) {
            Logger::Log(LogLevel::Info,
                        "You already have this version in `{}'",
                        tarball.string());
            return CompileResult{
                .status = CompileResult::Status::AlreadyExists,
                .tarball_path = tarball,
                .size = FileSystemManager::FileSize(tarball).value_or(0)};
        }

        auto const staged_manifest = build_dir_->GetPath() / kManifestName;
        if (not FileSystemManager::CopyFile(manifest_file_, staged_manifest)) {
            return unexpected{StagingError(
                fmt::format("Cannot copy release manifest {} to {}",
                            manifest_file_.string(),
                            staged_manifest.string()))};
        }

        CompileResult result{.status = CompileResult::Status::Built,
                             .tarball_path = tarball};
        std::vector<std::string> skipped_jobs{};

        Logger::Log(LogLevel::Info, "Copying packages");
        if (auto error = CopyArtifacts(ArtifactKind::Package,
                                       manifest_.Packages(),
                                       &result.copied_packages,
                                       &result.skipped_packages)) {
            return unexpected{*std::move(error)};
        }

        Logger::Log(LogLevel::Info, "Copying jobs");
        if (auto error = CopyArtifacts(ArtifactKind::Job,
                                       manifest_.Jobs(),
                                       &result.copied_jobs,
                                       &skipped_jobs)) {
            return unexpected{*std::move(error)};
        }

        Logger::Log(LogLevel::Info, "Building tarball");
        if (auto error = ArchiveOps::CreateArchive(
                ArchiveType::TarGz, build_dir_->GetPath(), tarball)) {
            return unexpected{CompileError{
                .kind = CompileErrorKind::ArchiveCreationFailed,
                .message = fmt::format("Cannot create release tarball: {}",
                                       *error)}};
        }
        result.size = FileSystemManager::FileSize(tarball).value_or(0);
        Logger::Log(LogLevel::Info, "Generated {}", tarball.string());
        Logger::Log(LogLevel::Info, "Release size: {}", PrettySize(result.size));
        return result;
    } catch (std::exception const& ex) {
        return unexpected{StagingError(
            fmt::format("Compiling release failed with:\n{}", ex.what()))};
    }
}

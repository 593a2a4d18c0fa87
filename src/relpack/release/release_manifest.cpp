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

#include "src/relpack/release/release_manifest.hpp"

#include <exception>
#include <optional>

#include "fmt/core.h"
#include "src/relpack/file_system/file_system_manager.hpp"
#include "src/utils/cpp/hex_string.hpp"
#include "src/utils/cpp/json.hpp"

namespace {

[[nodiscard]] auto ParseArtifact(nlohmann::json const& entry,
                                 ArtifactKind kind,
                                 std::size_t pos)
    -> expected<ArtifactDescriptor, std::string> {
    auto where = fmt::format("{} #{}", ToString(kind), pos);
    if (not entry.is_object()) {
        return unexpected{fmt::format("{} is not an object", where)};
    }
    std::string error{};
    auto name = ExtractValueAs<std::string>(
        entry, "name", [&error](auto const& msg) { error = msg; });
    if (not name) {
        return unexpected{fmt::format("{}: {}", where, error)};
    }
    if (not IsValidArtifactName(*name)) {
        return unexpected{
            fmt::format("{}: invalid artifact name \"{}\"", where, *name)};
    }
    where = fmt::format("{} {}", ToString(kind), *name);
    std::optional<std::string> version{};
    if (auto it = entry.find("version"); it != entry.end()) {
        version = JsonScalarToString(*it);
    }
    if (not version) {
        return unexpected{fmt::format(
            "{}: \"version\" must be given as string or number", where)};
    }
    auto sha1 = ExtractValueAs<std::string>(
        entry, "sha1", [&error](auto const& msg) { error = msg; });
    if (not sha1) {
        return unexpected{fmt::format("{}: {}", where, error)};
    }
    if (not IsHexString(*sha1)) {
        return unexpected{
            fmt::format("{}: sha1 \"{}\" is not a hex string", where, *sha1)};
    }
    std::optional<std::string> fingerprint{};
    if (auto it = entry.find("fingerprint");
        it != entry.end() and not it->is_null()) {
        if (not it->is_string()) {
            return unexpected{
                fmt::format("{}: \"fingerprint\" must be a string", where)};
        }
        fingerprint = it->get<std::string>();
    }
    return ArtifactDescriptor{.name = *std::move(name),
                              .version = *std::move(version),
                              .sha1 = *std::move(sha1),
                              .fingerprint = std::move(fingerprint)};
}

[[nodiscard]] auto ParseArtifacts(nlohmann::json const& json,
                                  std::string const& field,
                                  ArtifactKind kind)
    -> expected<std::vector<ArtifactDescriptor>, std::string> {
    auto it = json.find(field);
    if (it == json.end()) {
        return unexpected{fmt::format("missing field \"{}\"", field)};
    }
    if (not it->is_array()) {
        return unexpected{fmt::format("field \"{}\" must be a list", field)};
    }
    std::vector<ArtifactDescriptor> artifacts{};
    artifacts.reserve(it->size());
    for (std::size_t i = 0; i < it->size(); ++i) {
        auto artifact = ParseArtifact(it->at(i), kind, i);
        if (not artifact) {
            return unexpected{std::move(artifact).error()};
        }
        artifacts.emplace_back(*std::move(artifact));
    }
    return artifacts;
}

}  // namespace

auto ReleaseManifest::Load(std::filesystem::path const& file) noexcept
    -> expected<ReleaseManifest, std::string> {
    auto content = FileSystemManager::ReadFile(file);
    if (not content) {
        return unexpected{
            fmt::format("cannot read release manifest {}", file.string())};
    }
    try {
        auto manifest = FromJson(nlohmann::json::parse(*content));
        if (not manifest) {
            return unexpected{fmt::format("invalid release manifest {}: {}",
                                          file.string(),
                                          manifest.error())};
        }
        return manifest;
    } catch (std::exception const& e) {
        return unexpected{fmt::format(
            "parsing release manifest {} failed:\n{}", file.string(), e.what())};
    }
}

auto ReleaseManifest::FromJson(nlohmann::json const& json) noexcept
    -> expected<ReleaseManifest, std::string> {
    try {
        if (not json.is_object()) {
            return unexpected{fmt::format("expected an object, found {}",
                                          json.type_name())};
        }
        std::string error{};
        auto name = ExtractValueAs<std::string>(
            json, "name", [&error](auto const& msg) { error = msg; });
        if (not name) {
            return unexpected{fmt::format("release name: {}", error)};
        }
        if (not IsValidArtifactName(*name)) {
            return unexpected{
                fmt::format("invalid release name \"{}\"", *name)};
        }
        std::optional<std::string> version{};
        if (auto it = json.find("version"); it != json.end()) {
            version = JsonScalarToString(*it);
        }
        if (not version) {
            return unexpected{std::string{
                "release \"version\" must be given as string or number"}};
        }
        // name and version form the tarball file name
        if (not IsValidArtifactName(*version)) {
            return unexpected{
                fmt::format("invalid release version \"{}\"", *version)};
        }
        auto packages = ParseArtifacts(json, "packages", ArtifactKind::Package);
        if (not packages) {
            return unexpected{std::move(packages).error()};
        }
        auto jobs = ParseArtifacts(json, "jobs", ArtifactKind::Job);
        if (not jobs) {
            return unexpected{std::move(jobs).error()};
        }
        return ReleaseManifest{*std::move(name),
                               *std::move(version),
                               *std::move(packages),
                               *std::move(jobs)};
    } catch (std::exception const& e) {
        return unexpected{
            fmt::format("reading release manifest failed:\n{}", e.what())};
    }
}

auto ReleaseManifest::TarballName() const -> std::string {
    return fmt::format("{}-{}.tgz", name_, version_);
}

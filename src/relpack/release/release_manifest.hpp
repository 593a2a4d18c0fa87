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

#ifndef INCLUDED_SRC_RELPACK_RELEASE_RELEASE_MANIFEST_HPP
#define INCLUDED_SRC_RELPACK_RELEASE_RELEASE_MANIFEST_HPP

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"
#include "src/relpack/release/artifact.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Immutable, validated release manifest.
class ReleaseManifest {
  public:
    /// \brief Read and validate a manifest file.
    [[nodiscard]] static auto Load(std::filesystem::path const& file) noexcept
        -> expected<ReleaseManifest, std::string>;

    /// \brief Validate parsed manifest JSON. Requires "name", "version",
    /// "packages" and "jobs"; each artifact requires "name", "version" and
    /// "sha1", "fingerprint" is optional. Versions may be strings or numbers.
    [[nodiscard]] static auto FromJson(nlohmann::json const& json) noexcept
        -> expected<ReleaseManifest, std::string>;

    [[nodiscard]] auto Name() const& noexcept -> std::string const& {
        return name_;
    }
    [[nodiscard]] auto Version() const& noexcept -> std::string const& {
        return version_;
    }
    [[nodiscard]] auto Packages() const& noexcept
        -> std::vector<ArtifactDescriptor> const& {
        return packages_;
    }
    [[nodiscard]] auto Jobs() const& noexcept
        -> std::vector<ArtifactDescriptor> const& {
        return jobs_;
    }

    /// \brief File name of the release tarball, "<name>-<version>.tgz".
    [[nodiscard]] auto TarballName() const -> std::string;

  private:
    std::string name_;
    std::string version_;
    std::vector<ArtifactDescriptor> packages_;
    std::vector<ArtifactDescriptor> jobs_;

    ReleaseManifest(std::string name,
                    std::string version,
                    std::vector<ArtifactDescriptor> packages,
                    std::vector<ArtifactDescriptor> jobs) noexcept
        : name_{std::move(name)},
          version_{std::move(version)},
          packages_{std::move(packages)},
          jobs_{std::move(jobs)} {}
};

#endif  // INCLUDED_SRC_RELPACK_RELEASE_RELEASE_MANIFEST_HPP

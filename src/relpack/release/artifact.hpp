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

#ifndef INCLUDED_SRC_RELPACK_RELEASE_ARTIFACT_HPP
#define INCLUDED_SRC_RELPACK_RELEASE_ARTIFACT_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "gsl/gsl"

enum class ArtifactKind : std::uint8_t { Package, Job };

/// \brief Name used in messages, e.g., "package".
[[nodiscard]] static inline auto ToString(ArtifactKind kind) -> std::string {
    switch (kind) {
        case ArtifactKind::Package:
            return "package";
        case ArtifactKind::Job:
            return "job";
    }
    Ensures(false);  // unreachable
}

/// \brief Subdirectory of the builds trees and of the release tarball.
[[nodiscard]] static inline auto ToBuildsDirName(ArtifactKind kind)
    -> std::string {
    switch (kind) {
        case ArtifactKind::Package:
            return "packages";
        case ArtifactKind::Job:
            return "jobs";
    }
    Ensures(false);  // unreachable
}

/// \brief A release manifest's request for one package or job.
struct ArtifactDescriptor {
    std::string name{};
    std::string version{};
    std::string sha1{};
    std::optional<std::string> fingerprint{};
};

/// \brief Artifact names become file and directory names, so they must be
/// a single, non-special path component.
[[nodiscard]] static inline auto IsValidArtifactName(
    std::string const& name) noexcept -> bool {
    return not name.empty() and name != "." and name != ".." and
           name.find('/') == std::string::npos and
           name.find('\0') == std::string::npos;
}

#endif  // INCLUDED_SRC_RELPACK_RELEASE_ARTIFACT_HPP

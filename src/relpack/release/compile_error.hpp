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

#ifndef INCLUDED_SRC_RELPACK_RELEASE_COMPILE_ERROR_HPP
#define INCLUDED_SRC_RELPACK_RELEASE_COMPILE_ERROR_HPP

#include <cstdint>
#include <string>

#include "gsl/gsl"

enum class CompileErrorKind : std::uint8_t {
    InvalidManifest,        ///< Manifest unreadable or missing fields
    ArtifactNotFound,       ///< No index record matches the checksum
    ChecksumMismatch,       ///< Fetched or cached content has wrong sha1
    BlobstoreError,         ///< Remote store failed to deliver an object
    ArchiveCreationFailed,  ///< Writing the release tarball failed
    InvalidIndex,           ///< Unreadable index or record without blob id
    StagingFailed           ///< Staging or cache directory not writable
};

[[nodiscard]] static inline auto ToString(CompileErrorKind kind)
    -> std::string {
    switch (kind) {
        case CompileErrorKind::InvalidManifest:
            return "InvalidManifest";
        case CompileErrorKind::ArtifactNotFound:
            return "ArtifactNotFound";
        case CompileErrorKind::ChecksumMismatch:
            return "ChecksumMismatch";
        case CompileErrorKind::BlobstoreError:
            return "BlobstoreError";
        case CompileErrorKind::ArchiveCreationFailed:
            return "ArchiveCreationFailed";
        case CompileErrorKind::InvalidIndex:
            return "InvalidIndex";
        case CompileErrorKind::StagingFailed:
            return "StagingFailed";
    }
    Ensures(false);  // unreachable
}

struct CompileError {
    CompileErrorKind kind{};
    std::string message{};
};

#endif  // INCLUDED_SRC_RELPACK_RELEASE_COMPILE_ERROR_HPP

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

#ifndef INCLUDED_SRC_RELPACK_MAIN_RELEASE_CONFIG_HPP
#define INCLUDED_SRC_RELPACK_MAIN_RELEASE_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "src/relpack/blobstore/config.hpp"
#include "src/relpack/main/cli.hpp"
#include "src/utils/cpp/expected.hpp"

static constexpr auto kFinalConfigFile = "config/final.json";
static constexpr auto kPrivateConfigFile = "config/private.json";

/// \brief Combine the blobstore section of the release's final.json with the
/// options of private.json and the command-line overrides.
/// \returns the configuration, std::nullopt if no blobstore is configured at
/// all, or an error message.
[[nodiscard]] auto ReadBlobstoreConfig(
    std::filesystem::path const& release_dir,
    RelpackBlobstoreArguments const& overrides) noexcept
    -> expected<std::optional<BlobstoreConfig>, std::string>;

/// \brief Same as \ref ReadBlobstoreConfig, from already parsed files.
[[nodiscard]] auto MergeBlobstoreConfig(
    std::filesystem::path const& release_dir,
    std::optional<nlohmann::json> const& final_config,
    std::optional<nlohmann::json> const& private_config,
    RelpackBlobstoreArguments const& overrides) noexcept
    -> expected<std::optional<BlobstoreConfig>, std::string>;

/// \brief Read a JSON list of checksums.
[[nodiscard]] auto ReadPackageMatches(std::filesystem::path const& file) noexcept
    -> expected<std::vector<std::string>, std::string>;

#endif  // INCLUDED_SRC_RELPACK_MAIN_RELEASE_CONFIG_HPP

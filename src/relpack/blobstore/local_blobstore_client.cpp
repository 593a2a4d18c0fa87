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

#include "src/relpack/blobstore/local_blobstore_client.hpp"

#include "fmt/core.h"
#include "src/relpack/file_system/file_system_manager.hpp"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/logger.hpp"

auto LocalBlobstoreClient::Fetch(std::string const& id) noexcept
    -> expected<std::string, BlobstoreFetchError> {
    if (id.empty() or id.find('/') != std::string::npos or id == "." or
        id == "..") {
        return unexpected{BlobstoreFetchError{
            .kind = BlobstoreFetchError::Kind::NotFound,
            .message = fmt::format("invalid blobstore id \"{}\"", id)}};
    }
    auto const path = blobstore_path_ / id;
    if (not FileSystemManager::IsFile(path)) {
        return unexpected{BlobstoreFetchError{
            .kind = BlobstoreFetchError::Kind::NotFound,
            .message = fmt::format(
                "blob {} not found in {}", id, blobstore_path_.string())}};
    }
    Logger::Log(LogLevel::Debug, "Reading blob {}", path.string());
    auto content = FileSystemManager::ReadFile(path);
    if (not content) {
        return unexpected{BlobstoreFetchError{
            .kind = BlobstoreFetchError::Kind::Transport,
            .message = fmt::format("cannot read blob {}", path.string())}};
    }
    return *std::move(content);
}

auto LocalBlobstoreClient::Describe() const -> std::string {
    return fmt::format("local blobstore at {}", blobstore_path_.string());
}

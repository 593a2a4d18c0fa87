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

#ifndef INCLUDED_SRC_RELPACK_BLOBSTORE_LOCAL_BLOBSTORE_CLIENT_HPP
#define INCLUDED_SRC_RELPACK_BLOBSTORE_LOCAL_BLOBSTORE_CLIENT_HPP

#include <filesystem>
#include <string>
#include <utility>

#include "src/relpack/blobstore/blobstore_client.hpp"

/// \brief Blobstore backed by a plain directory: object <id> is the file
/// <blobstore_path>/<id>.
class LocalBlobstoreClient final : public IBlobstoreClient {
  public:
    explicit LocalBlobstoreClient(std::filesystem::path blobstore_path) noexcept
        : blobstore_path_{std::move(blobstore_path)} {}

    [[nodiscard]] auto Fetch(std::string const& id) noexcept
        -> expected<std::string, BlobstoreFetchError> final;

    [[nodiscard]] auto Describe() const -> std::string final;

  private:
    std::filesystem::path blobstore_path_;
};

#endif  // INCLUDED_SRC_RELPACK_BLOBSTORE_LOCAL_BLOBSTORE_CLIENT_HPP

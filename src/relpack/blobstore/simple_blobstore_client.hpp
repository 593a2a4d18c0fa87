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

#ifndef INCLUDED_SRC_RELPACK_BLOBSTORE_SIMPLE_BLOBSTORE_CLIENT_HPP
#define INCLUDED_SRC_RELPACK_BLOBSTORE_SIMPLE_BLOBSTORE_CLIENT_HPP

#include <filesystem>
#include <optional>
#include <string>

#include "src/relpack/blobstore/blobstore_client.hpp"

/// \brief Blobstore served over HTTP: object <id> is fetched by a GET on
/// <endpoint>/resources/<id>, optionally with basic authentication.
class SimpleBlobstoreClient final : public IBlobstoreClient {
  public:
    struct Options {
        std::string endpoint{};
        std::optional<std::string> user{};
        std::optional<std::string> password{};
        bool no_ssl_verify{false};
        std::optional<std::filesystem::path> ca_bundle{};
    };

    explicit SimpleBlobstoreClient(Options options) noexcept;

    [[nodiscard]] auto Fetch(std::string const& id) noexcept
        -> expected<std::string, BlobstoreFetchError> final;

    [[nodiscard]] auto Describe() const -> std::string final;

    /// \brief URL of the object with the given id.
    [[nodiscard]] auto ResourceUrl(std::string const& id) const -> std::string;

  private:
    Options options_;
};

#endif  // INCLUDED_SRC_RELPACK_BLOBSTORE_SIMPLE_BLOBSTORE_CLIENT_HPP

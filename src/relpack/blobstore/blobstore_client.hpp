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

#ifndef INCLUDED_SRC_RELPACK_BLOBSTORE_BLOBSTORE_CLIENT_HPP
#define INCLUDED_SRC_RELPACK_BLOBSTORE_BLOBSTORE_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "src/utils/cpp/expected.hpp"

/// \brief Failure of a single blobstore fetch.
struct BlobstoreFetchError {
    enum class Kind : std::uint8_t {
        NotFound,  ///< The store answered, but has no object with that id.
        Transport  ///< The store could not be reached or read.
    };
    Kind kind{Kind::Transport};
    std::string message{};
};

/// \brief Remote content store, addressed by opaque object id.
class IBlobstoreClient {
  public:
    using Ptr = std::shared_ptr<IBlobstoreClient>;

    IBlobstoreClient() = default;
    IBlobstoreClient(IBlobstoreClient const&) = delete;
    IBlobstoreClient(IBlobstoreClient&&) = delete;
    auto operator=(IBlobstoreClient const&) -> IBlobstoreClient& = delete;
    auto operator=(IBlobstoreClient&&) -> IBlobstoreClient& = delete;
    virtual ~IBlobstoreClient() = default;

    /// \brief Fetch the full content of an object. Blocking, no retries.
    [[nodiscard]] virtual auto Fetch(std::string const& id) noexcept
        -> expected<std::string, BlobstoreFetchError> = 0;

    /// \brief Human readable description used in diagnostics.
    [[nodiscard]] virtual auto Describe() const -> std::string = 0;
};

#endif  // INCLUDED_SRC_RELPACK_BLOBSTORE_BLOBSTORE_CLIENT_HPP

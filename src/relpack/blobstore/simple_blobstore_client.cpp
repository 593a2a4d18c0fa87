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

#include "src/relpack/blobstore/simple_blobstore_client.hpp"

#include <exception>
#include <utility>

#include "fmt/core.h"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/logger.hpp"
#include "src/utils/cpp/curl_easy_handle.hpp"

namespace {
constexpr long kHttpNotFound = 404;  // NOLINT(google-runtime-int)
}  // namespace

SimpleBlobstoreClient::SimpleBlobstoreClient(Options options) noexcept
    : options_{std::move(options)} {
    // strip trailing slashes, as resource paths are appended with one
    while (not options_.endpoint.empty() and options_.endpoint.back() == '/') {
        options_.endpoint.pop_back();
    }
}

auto SimpleBlobstoreClient::ResourceUrl(std::string const& id) const
    -> std::string {
    return fmt::format("{}/resources/{}", options_.endpoint, id);
}

auto SimpleBlobstoreClient::Fetch(std::string const& id) noexcept
    -> expected<std::string, BlobstoreFetchError> {
    try {
        auto curl =
            CurlEasyHandle::Create(options_.no_ssl_verify, options_.ca_bundle);
        if (not curl) {
            return unexpected{BlobstoreFetchError{
                .kind = BlobstoreFetchError::Kind::Transport,
                .message = "could not create curl handle"}};
        }
        if (options_.user) {
            curl->SetBasicAuth(*options_.user,
                               options_.password.value_or(std::string{}));
        }
        auto const url = ResourceUrl(id);
        Logger::Log(LogLevel::Progress, "Fetching {}", url);
        auto content = curl->DownloadToString(url);
        if (not content) {
            auto kind = curl->ResponseCode() == kHttpNotFound
                            ? BlobstoreFetchError::Kind::NotFound
                            : BlobstoreFetchError::Kind::Transport;
            return unexpected{BlobstoreFetchError{
                .kind = kind, .message = std::move(content).error()}};
        }
        return *std::move(content);
    } catch (std::exception const& ex) {
        return unexpected{BlobstoreFetchError{
            .kind = BlobstoreFetchError::Kind::Transport,
            .message = fmt::format("fetching blob {} failed with:\n{}",
                                   id,
                                   ex.what())}};
    }
}

auto SimpleBlobstoreClient::Describe() const -> std::string {
    return fmt::format("simple blobstore at {}", options_.endpoint);
}

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

#ifndef INCLUDED_SRC_RELPACK_BLOBSTORE_CONFIG_HPP
#define INCLUDED_SRC_RELPACK_BLOBSTORE_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "fmt/core.h"
#include "src/utils/cpp/expected.hpp"

enum class BlobstoreProvider : std::uint8_t { Local, Simple };

[[nodiscard]] static inline auto ParseBlobstoreProvider(
    std::string const& name) noexcept -> std::optional<BlobstoreProvider> {
    if (name == "local") {
        return BlobstoreProvider::Local;
    }
    if (name == "simple") {
        return BlobstoreProvider::Simple;
    }
    return std::nullopt;
}

struct BlobstoreConfig final {
    class Builder;

    BlobstoreProvider const provider{BlobstoreProvider::Local};

    // Directory holding the objects (local provider).
    std::optional<std::filesystem::path> const blobstore_path{};

    // Base URL of the store (simple provider).
    std::optional<std::string> const endpoint{};

    // Basic-auth credentials (simple provider).
    std::optional<std::string> const user{};
    std::optional<std::string> const password{};

    // SSL settings (simple provider).
    bool const no_ssl_verify{false};
    std::optional<std::filesystem::path> const ca_bundle{};
};

class BlobstoreConfig::Builder final {
  public:
    auto SetProvider(std::string value) noexcept -> Builder& {
        provider_ = std::move(value);
        return *this;
    }

    auto SetBlobstorePath(std::filesystem::path value) noexcept -> Builder& {
        blobstore_path_ = std::move(value);
        return *this;
    }

    auto SetEndpoint(std::string value) noexcept -> Builder& {
        endpoint_ = std::move(value);
        return *this;
    }

    auto SetUser(std::string value) noexcept -> Builder& {
        user_ = std::move(value);
        return *this;
    }

    auto SetPassword(std::string value) noexcept -> Builder& {
        password_ = std::move(value);
        return *this;
    }

    auto SetNoSslVerify(bool value) noexcept -> Builder& {
        no_ssl_verify_ = value;
        return *this;
    }

    auto SetCaBundle(std::filesystem::path value) noexcept -> Builder& {
        ca_bundle_ = std::move(value);
        return *this;
    }

    /// \brief Finalize building and create BlobstoreConfig.
    /// \return BlobstoreConfig on success or an error on failure.
    [[nodiscard]] auto Build() const noexcept
        -> expected<BlobstoreConfig, std::string> {
        BlobstoreConfig const default_config{};

        auto provider = default_config.provider;
        if (provider_.has_value()) {
            auto parsed = ParseBlobstoreProvider(*provider_);
            if (not parsed) {
                return unexpected{fmt::format(
                    "Unknown blobstore provider '{}'.", *provider_)};
            }
            provider = *parsed;
        }

        switch (provider) {
            case BlobstoreProvider::Local:
                if (not blobstore_path_ or blobstore_path_->empty()) {
                    return unexpected{std::string{
                        "Local blobstore requires option 'blobstore_path'."}};
                }
                break;
            case BlobstoreProvider::Simple:
                if (not endpoint_ or endpoint_->empty()) {
                    return unexpected{std::string{
                        "Simple blobstore requires option 'endpoint'."}};
                }
                if (password_ and not user_) {
                    return unexpected{std::string{
                        "Blobstore option 'password' given without 'user'."}};
                }
                break;
        }

        return BlobstoreConfig{.provider = provider,
                               .blobstore_path = blobstore_path_,
                               .endpoint = endpoint_,
                               .user = user_,
                               .password = password_,
                               .no_ssl_verify = no_ssl_verify_,
                               .ca_bundle = ca_bundle_};
    }

  private:
    std::optional<std::string> provider_{};
    std::optional<std::filesystem::path> blobstore_path_{};
    std::optional<std::string> endpoint_{};
    std::optional<std::string> user_{};
    std::optional<std::string> password_{};
    bool no_ssl_verify_{false};
    std::optional<std::filesystem::path> ca_bundle_{};
};

#endif  // INCLUDED_SRC_RELPACK_BLOBSTORE_CONFIG_HPP

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

#include "src/relpack/main/release_config.hpp"

#include <exception>
#include <utility>

#include "fmt/core.h"
#include "src/relpack/file_system/file_system_manager.hpp"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/logger.hpp"

namespace {

/// \brief Parse an optional JSON file; a missing file is not an error.
[[nodiscard]] auto ReadOptionalJson(std::filesystem::path const& file)
    -> expected<std::optional<nlohmann::json>, std::string> {
    if (not FileSystemManager::Exists(file)) {
        return std::optional<nlohmann::json>{};
    }
    auto content = FileSystemManager::ReadFile(file);
    if (not content) {
        return unexpected{fmt::format("cannot read {}", file.string())};
    }
    try {
        auto json = nlohmann::json::parse(*content);
        if (not json.is_object()) {
            return unexpected{
                fmt::format("{} does not contain a JSON object", file.string())};
        }
        return std::optional<nlohmann::json>{std::move(json)};
    } catch (std::exception const& e) {
        return unexpected{
            fmt::format("parsing {} failed:\n{}", file.string(), e.what())};
    }
}

/// \brief The "blobstore" section of a configuration, if any.
[[nodiscard]] auto BlobstoreSection(std::optional<nlohmann::json> const& config,
                                    std::string const& origin)
    -> expected<nlohmann::json, std::string> {
    if (not config) {
        return nlohmann::json::object();
    }
    auto it = config->find("blobstore");
    if (it == config->end() or it->is_null()) {
        return nlohmann::json::object();
    }
    if (not it->is_object()) {
        return unexpected{
            fmt::format("\"blobstore\" in {} must be an object", origin)};
    }
    auto options = it->find("options");
    if (options != it->end() and not options->is_object()) {
        return unexpected{fmt::format(
            "\"blobstore.options\" in {} must be an object", origin)};
    }
    return *it;
}

[[nodiscard]] auto StringOption(nlohmann::json const& options,
                                std::string const& key)
    -> expected<std::optional<std::string>, std::string> {
    auto it = options.find(key);
    if (it == options.end() or it->is_null()) {
        return std::optional<std::string>{};
    }
    if (not it->is_string()) {
        return unexpected{
            fmt::format("blobstore option \"{}\" must be a string", key)};
    }
    return std::optional<std::string>{it->get<std::string>()};
}

}  // namespace

auto MergeBlobstoreConfig(std::filesystem::path const& release_dir,
                          std::optional<nlohmann::json> const& final_config,
                          std::optional<nlohmann::json> const& private_config,
                          RelpackBlobstoreArguments const& overrides) noexcept
    -> expected<std::optional<BlobstoreConfig>, std::string> {
    try {
        auto final_section = BlobstoreSection(final_config, kFinalConfigFile);
        if (not final_section) {
            return unexpected{std::move(final_section).error()};
        }
        auto private_section =
            BlobstoreSection(private_config, kPrivateConfigFile);
        if (not private_section) {
            return unexpected{std::move(private_section).error()};
        }

        // private options (credentials) take precedence over final ones
        auto options =
            final_section->value("options", nlohmann::json::object());
        options.update(
            private_section->value("options", nlohmann::json::object()));

        std::optional<std::string> provider{};
        for (auto const* section : {&*private_section, &*final_section}) {
            if (auto it = section->find("provider");
                it != section->end() and not provider) {
                if (not it->is_string()) {
                    return unexpected{std::string{
                        "blobstore \"provider\" must be a string"}};
                }
                provider = it->get<std::string>();
            }
        }

        BlobstoreConfig::Builder builder{};
        auto const set_string = [&options](std::string const& key,
                                           auto const& setter)
            -> std::optional<std::string> {
            auto value = StringOption(options, key);
            if (not value) {
                return std::move(value).error();
            }
            if (*value) {
                setter(**value);
            }
            return std::nullopt;
        };
        if (auto error = set_string("blobstore_path", [&](auto const& path) {
                builder.SetBlobstorePath(release_dir / path);
            })) {
            return unexpected{*std::move(error)};
        }
        if (auto error = set_string(
                "endpoint", [&](auto const& v) { builder.SetEndpoint(v); })) {
            return unexpected{*std::move(error)};
        }
        if (auto error =
                set_string("user", [&](auto const& v) { builder.SetUser(v); })) {
            return unexpected{*std::move(error)};
        }
        if (auto error = set_string(
                "password", [&](auto const& v) { builder.SetPassword(v); })) {
            return unexpected{*std::move(error)};
        }

        // command-line overrides select the provider they belong to
        if (overrides.blobstore_path) {
            provider = "local";
            builder.SetBlobstorePath(*overrides.blobstore_path);
        }
        if (overrides.endpoint) {
            provider = "simple";
            builder.SetEndpoint(*overrides.endpoint);
        }
        if (not provider) {
            Logger::Log(LogLevel::Debug,
                        "No blobstore configured for release {}",
                        release_dir.string());
            return std::optional<BlobstoreConfig>{};
        }
        builder.SetProvider(*provider).SetNoSslVerify(overrides.no_ssl_verify);
        if (overrides.ca_bundle) {
            builder.SetCaBundle(*overrides.ca_bundle);
        }

        auto config = builder.Build();
        if (not config) {
            return unexpected{std::move(config).error()};
        }
        return std::optional<BlobstoreConfig>{*std::move(config)};
    } catch (std::exception const& e) {
        return unexpected{fmt::format(
            "reading blobstore configuration failed:\n{}", e.what())};
    }
}

auto ReadBlobstoreConfig(std::filesystem::path const& release_dir,
                         RelpackBlobstoreArguments const& overrides) noexcept
    -> expected<std::optional<BlobstoreConfig>, std::string> {
    try {
        auto final_config = ReadOptionalJson(release_dir / kFinalConfigFile);
        if (not final_config) {
            return unexpected{std::move(final_config).error()};
        }
        auto private_config =
            ReadOptionalJson(release_dir / kPrivateConfigFile);
        if (not private_config) {
            return unexpected{std::move(private_config).error()};
        }
        return MergeBlobstoreConfig(
            release_dir, *final_config, *private_config, overrides);
    } catch (std::exception const& e) {
        return unexpected{fmt::format(
            "reading release configuration failed:\n{}", e.what())};
    }
}

auto ReadPackageMatches(std::filesystem::path const& file) noexcept
    -> expected<std::vector<std::string>, std::string> {
    auto content = FileSystemManager::ReadFile(file);
    if (not content) {
        return unexpected{
            fmt::format("cannot read package matches file {}", file.string())};
    }
    try {
        auto json = nlohmann::json::parse(*content);
        if (not json.is_array()) {
            return unexpected{fmt::format(
                "package matches file {} must contain a list", file.string())};
        }
        return json.get<std::vector<std::string>>();
    } catch (std::exception const& e) {
        return unexpected{fmt::format("parsing package matches file {} "
                                      "failed:\n{}",
                                      file.string(),
                                      e.what())};
    }
}

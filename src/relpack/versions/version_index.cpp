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

#include "src/relpack/versions/version_index.hpp"

#include <algorithm>
#include <exception>
#include <iterator>

#include "fmt/core.h"
#include "src/relpack/file_system/file_system_manager.hpp"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/logger.hpp"
#include "src/utils/cpp/hex_string.hpp"
#include "src/utils/cpp/json.hpp"

namespace {

/// \brief Read an optional string field; numbers are accepted for "version".
[[nodiscard]] auto ReadOptionalField(nlohmann::ordered_json const& entry,
                                     std::string const& field,
                                     bool allow_number)
    -> expected<std::optional<std::string>, std::string> {
    auto it = entry.find(field);
    if (it == entry.end() or it->is_null()) {
        return std::optional<std::string>{};
    }
    if (it->is_string() or (allow_number and it->is_number())) {
        return JsonScalarToString(*it);
    }
    return unexpected{
        fmt::format("field \"{}\" has unexpected type {}", field, it->type_name())};
}

}  // namespace

auto VersionIndex::Load(std::filesystem::path const& dir) noexcept
    -> expected<VersionIndex, std::string> {
    auto const index_file = dir / kIndexFileName;
    if (not FileSystemManager::Exists(index_file)) {
        Logger::Log(LogLevel::Debug,
                    "No version index at {}, treating it as empty",
                    index_file.string());
        return VersionIndex{dir, {}};
    }
    auto content = FileSystemManager::ReadFile(index_file);
    if (not content) {
        return unexpected{
            fmt::format("cannot read version index {}", index_file.string())};
    }
    try {
        auto json = nlohmann::ordered_json::parse(*content);
        auto index = FromJson(json, dir);
        if (not index) {
            return unexpected{fmt::format("malformed version index {}: {}",
                                          index_file.string(),
                                          index.error())};
        }
        return index;
    } catch (std::exception const& e) {
        return unexpected{fmt::format("parsing version index {} failed:\n{}",
                                      index_file.string(),
                                      e.what())};
    }
}

auto VersionIndex::FromJson(nlohmann::ordered_json const& json,
                            std::filesystem::path dir) noexcept
    -> expected<VersionIndex, std::string> {
    try {
        if (not json.is_object()) {
            return unexpected{fmt::format("expected an object, found {}",
                                          json.type_name())};
        }
        std::vector<VersionRecord> records{};
        auto builds = json.find("builds");
        if (builds == json.end() or builds->is_null()) {
            return VersionIndex{std::move(dir), std::move(records)};
        }
        if (not builds->is_object()) {
            return unexpected{fmt::format(
                "\"builds\" must be an object, found {}", builds->type_name())};
        }
        records.reserve(builds->size());
        for (auto const& [key, entry] : builds->items()) {
            if (not entry.is_object()) {
                return unexpected{
                    fmt::format("build {} is not an object", key)};
            }
            auto version = ReadOptionalField(entry, "version", true);
            auto sha1 = ReadOptionalField(entry, "sha1", false);
            auto blobstore_id = ReadOptionalField(entry, "blobstore_id", false);
            for (auto const* field : {&version, &sha1, &blobstore_id}) {
                if (not *field) {
                    return unexpected{
                        fmt::format("build {}: {}", key, field->error())};
                }
            }
            records.emplace_back(VersionRecord{.key = key,
                                               .version = *version,
                                               .sha1 = *sha1,
                                               .blobstore_id = *blobstore_id});
        }
        return VersionIndex{std::move(dir), std::move(records)};
    } catch (std::exception const& e) {
        return unexpected{
            fmt::format("reading version records failed:\n{}", e.what())};
    }
}

auto VersionIndex::Select(RecordPredicate const& predicate) const
    -> std::vector<VersionRecord> {
    std::vector<VersionRecord> selected{};
    std::copy_if(records_.begin(),
                 records_.end(),
                 std::back_inserter(selected),
                 predicate);
    return selected;
}

auto VersionIndex::FindBySha1(std::string const& sha1) const
    -> std::optional<VersionRecord> {
    auto const wanted = NormalizeHexString(sha1);
    auto it = std::find_if(
        records_.begin(), records_.end(), [&wanted](auto const& record) {
            return record.sha1 and NormalizeHexString(*record.sha1) == wanted;
        });
    if (it == records_.end()) {
        return std::nullopt;
    }
    return *it;
}

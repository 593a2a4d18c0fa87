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

#include "src/relpack/versions/local_version_storage.hpp"

#include "fmt/core.h"
#include "src/relpack/file_system/file_system_manager.hpp"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/logger.hpp"
#include "src/relpack/versions/version_index.hpp"

auto LocalVersionStorage::Lookup(std::string const& id) const noexcept
    -> std::optional<std::filesystem::path> {
    if (not IsValidId(id)) {
        Logger::Log(LogLevel::Warning,
                    "Ignoring lookup of invalid storage id \"{}\"",
                    id);
        return std::nullopt;
    }
    auto path = storage_root_ / id;
    if (FileSystemManager::IsFile(path)) {
        Logger::Log(LogLevel::Debug, "Found cached entry {}", path.string());
        return path;
    }
    return std::nullopt;
}

auto LocalVersionStorage::Store(std::string const& id,
                                std::string const& bytes) const noexcept
    -> expected<std::filesystem::path, std::string> {
    if (not IsValidId(id)) {
        return unexpected{fmt::format("invalid storage id \"{}\"", id)};
    }
    auto path = storage_root_ / id;
    if (not FileSystemManager::WriteFileAtomic(bytes, path)) {
        return unexpected{
            fmt::format("could not store {} in {}", id, storage_root_.string())};
    }
    Logger::Log(LogLevel::Trace, "created entry {}.", path.string());
    return path;
}

auto LocalVersionStorage::IsValidId(std::string const& id) noexcept -> bool {
    return not id.empty() and id != "." and id != ".." and
           id.find('/') == std::string::npos and
           id.find('\0') == std::string::npos and
           id != VersionIndex::kIndexFileName;
}

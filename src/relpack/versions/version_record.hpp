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

#ifndef INCLUDED_SRC_RELPACK_VERSIONS_VERSION_RECORD_HPP
#define INCLUDED_SRC_RELPACK_VERSIONS_VERSION_RECORD_HPP

#include <optional>
#include <string>

/// \brief One entry of a version index. Only the synthetic key is mandatory;
/// a record lacking a sha1 never matches a lookup.
struct VersionRecord {
    std::string key{};
    std::optional<std::string> version{};
    std::optional<std::string> sha1{};
    std::optional<std::string> blobstore_id{};
};

#endif  // INCLUDED_SRC_RELPACK_VERSIONS_VERSION_RECORD_HPP

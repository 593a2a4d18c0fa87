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

#ifndef INCLUDED_SRC_UTILS_CPP_JSON_HPP
#define INCLUDED_SRC_UTILS_CPP_JSON_HPP

#include <exception>
#include <functional>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

/// \brief Extract the value under key as ValueT. Missing keys and type
/// mismatches are reported through the logger callback.
template <typename ValueT, typename JsonT = nlohmann::json>
auto ExtractValueAs(
    JsonT const& j,
    std::string const& key,
    std::function<void(std::string const& error)>&& logger =
        [](std::string const& /*unused*/) -> void {}) noexcept
    -> std::optional<ValueT> {
    try {
        auto it = j.find(key);
        if (it == j.end()) {
            logger("key " + key + " cannot be found in JSON object");
            return std::nullopt;
        }
        return it.value().template get<ValueT>();
    } catch (std::exception& e) {
        logger(e.what());
        return std::nullopt;
    }
}

/// \brief Render a scalar that may be written either as string or as number,
/// e.g., a version "1.2" or 3. Other types yield std::nullopt.
template <typename JsonT>
[[nodiscard]] auto JsonScalarToString(JsonT const& j)
    -> std::optional<std::string> {
    if (j.is_string()) {
        return j.template get<std::string>();
    }
    if (j.is_number()) {
        return j.dump();
    }
    return std::nullopt;
}

#endif  // INCLUDED_SRC_UTILS_CPP_JSON_HPP

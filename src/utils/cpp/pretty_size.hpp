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

#ifndef INCLUDED_SRC_UTILS_CPP_PRETTY_SIZE_HPP
#define INCLUDED_SRC_UTILS_CPP_PRETTY_SIZE_HPP

#include <cstdint>
#include <string>

#include "fmt/core.h"

/// \brief Render a byte count with a binary unit suffix, e.g., "512B",
/// "1.5K", "20.0M".
[[nodiscard]] static inline auto PrettySize(std::uintmax_t size) -> std::string {
    constexpr double kKiB = 1024.0;
    constexpr double kMiB = kKiB * kKiB;
    constexpr double kGiB = kMiB * kKiB;
    auto const bytes = static_cast<double>(size);
    if (bytes < kKiB) {
        return fmt::format("{}B", size);
    }
    if (bytes < kMiB) {
        return fmt::format("{:.1f}K", bytes / kKiB);
    }
    if (bytes < kGiB) {
        return fmt::format("{:.1f}M", bytes / kMiB);
    }
    return fmt::format("{:.1f}G", bytes / kGiB);
}

#endif  // INCLUDED_SRC_UTILS_CPP_PRETTY_SIZE_HPP

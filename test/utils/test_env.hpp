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

#ifndef INCLUDED_SRC_TEST_UTILS_TEST_ENV_HPP
#define INCLUDED_SRC_TEST_UTILS_TEST_ENV_HPP

#include <cstdlib>
#include <filesystem>
#include <string>

/// \brief Scratch directory of the test run. The test launcher sets
/// TEST_TMPDIR; fall back to the system's temporary directory otherwise.
[[nodiscard]] static inline auto GetTestTmpDir() -> std::filesystem::path {
    auto* tmp_dir = std::getenv("TEST_TMPDIR");
    if (tmp_dir not_eq nullptr) {
        return std::filesystem::path{std::string{tmp_dir}};
    }
    return std::filesystem::temp_directory_path() / "relpack-tests";
}

#endif  // INCLUDED_SRC_TEST_UTILS_TEST_ENV_HPP

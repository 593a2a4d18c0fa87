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

#include "src/utils/cpp/tmp_dir.hpp"

#ifdef __unix__
#include <unistd.h>
#else
#error "Non-unix is not supported yet"
#endif

#include <cstdlib>
#include <tuple>

#include "src/relpack/file_system/file_system_manager.hpp"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/logger.hpp"

auto TmpDir::Create(std::filesystem::path const& prefix,
                    std::string const& name_prefix) noexcept -> Ptr {
    // make sure prefix folder exists
    if (not FileSystemManager::CreateDirectory(prefix)) {
        Logger::Log(LogLevel::Error,
                    "TmpDir: could not create prefix directory {}",
                    prefix.string());
        return nullptr;
    }

    std::string dir_path;
    try {
        dir_path = std::filesystem::weakly_canonical(
            prefix / (name_prefix + ".XXXXXX"));
        if (mkdtemp(dir_path.data()) == nullptr) {
            Logger::Log(LogLevel::Error,
                        "TmpDir: could not create temporary directory in {}",
                        prefix.string());
            return nullptr;
        }
        return std::shared_ptr<TmpDir const>(new TmpDir(dir_path));
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error,
                    "TmpDir: creating temporary directory failed with:\n{}",
                    ex.what());
        if (not dir_path.empty()) {
            rmdir(dir_path.c_str());
        }
    }
    return nullptr;
}

TmpDir::~TmpDir() noexcept {
    // try to remove the tmp dir and all its content
    std::ignore = FileSystemManager::RemoveDirectory(tmp_dir_,
                                                     /*recursively=*/true);
}

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

#include "src/relpack/archive/archive_ops.hpp"

#include <string>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/relpack/file_system/file_system_manager.hpp"
#include "src/utils/cpp/tmp_dir.hpp"
#include "test/utils/test_env.hpp"

namespace {

// tar formats may mark directories with a trailing slash
[[nodiscard]] auto StripSlashes(std::vector<std::string> names)
    -> std::vector<std::string> {
    for (auto& name : names) {
        while (not name.empty() and name.back() == '/') {
            name.pop_back();
        }
    }
    return names;
}

}  // namespace

TEST_CASE("Create and list archives", "[archive]") {
    auto tmp = TmpDir::Create(GetTestTmpDir(), "archive");
    REQUIRE(tmp != nullptr);
    auto const source = tmp->GetPath() / "source";
    REQUIRE(FileSystemManager::WriteFile("manifest", source / "release.MF"));
    REQUIRE(FileSystemManager::WriteFile("p", source / "packages" / "p1.tgz"));
    REQUIRE(FileSystemManager::WriteFile("j", source / "jobs" / "j1.tgz"));
    REQUIRE(FileSystemManager::CreateDirectory(source / "empty"));

    std::vector<std::string> const expected{"empty",
                                            "jobs",
                                            "jobs/j1.tgz",
                                            "packages",
                                            "packages/p1.tgz",
                                            "release.MF"};

    SECTION("gzip compressed") {
        auto const archive = tmp->GetPath() / "out" / "release.tgz";
        REQUIRE_FALSE(
            ArchiveOps::CreateArchive(ArchiveType::TarGz, source, archive));
        REQUIRE(FileSystemManager::IsFile(archive));
        auto entries = ArchiveOps::ListEntries(archive);
        REQUIRE(entries);
        CHECK(StripSlashes(*entries) == expected);
    }

    SECTION("uncompressed") {
        auto const archive = tmp->GetPath() / "release.tar";
        REQUIRE_FALSE(
            ArchiveOps::CreateArchive(ArchiveType::Tar, source, archive));
        auto entries = ArchiveOps::ListEntries(archive);
        REQUIRE(entries);
        CHECK(StripSlashes(*entries) == expected);
    }

    SECTION("missing source") {
        auto const archive = tmp->GetPath() / "missing.tgz";
        CHECK(ArchiveOps::CreateArchive(
            ArchiveType::TarGz, tmp->GetPath() / "nowhere", archive));
        CHECK_FALSE(FileSystemManager::Exists(archive));
    }

    SECTION("listing a non-archive") {
        auto const bogus = tmp->GetPath() / "bogus.tgz";
        REQUIRE(FileSystemManager::WriteFile("not an archive", bogus));
        CHECK_FALSE(ArchiveOps::ListEntries(bogus));
    }
}

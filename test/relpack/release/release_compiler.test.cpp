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

#include "src/relpack/release/release_compiler.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "nlohmann/json.hpp"
#include "src/relpack/archive/archive_ops.hpp"
#include "src/relpack/file_system/file_system_manager.hpp"
#include "src/relpack/release/compile_error.hpp"
#include "test/utils/release_fixture.hpp"
#include "test/utils/test_env.hpp"

using Tier = ArtifactLocator::Tier;

namespace {

[[nodiscard]] auto FileEntries(std::filesystem::path const& tarball)
    -> std::vector<std::string> {
    auto entries = ArchiveOps::ListEntries(tarball);
    REQUIRE(entries);
    std::vector<std::string> files{};
    std::copy_if(entries->begin(),
                 entries->end(),
                 std::back_inserter(files),
                 [](auto const& name) { return not name.ends_with('/'); });
    std::erase(files, "jobs");
    std::erase(files, "packages");
    return files;
}

}  // namespace

class CompilerFixture : public ReleaseFixture {
  public:
    CompilerFixture() {
        p1_sha1_ = AddBuild(Tier::Dev,
                            ArtifactKind::Package,
                            "p1",
                            "1.1-dev",
                            "p1 content",
                            "b1");
        j1_sha1_ = AddBuild(
            Tier::Final, ArtifactKind::Job, "j1", "4", "j1 content", "b2");
        manifest_ = nlohmann::json::object();
        manifest_["name"] = "demo";
        manifest_["version"] = "1";
        manifest_["packages"] =
            nlohmann::json::array({nlohmann::json{{"name", "p1"},
                                                  {"version", "1.1-dev"},
                                                  {"sha1", p1_sha1_},
                                                  {"fingerprint", "fp1"}}});
        manifest_["jobs"] = nlohmann::json::array({nlohmann::json{
            {"name", "j1"}, {"version", "4"}, {"sha1", j1_sha1_}}});
        manifest_file_ = WriteManifest("dev_releases/demo-1.yml", manifest_);
        staging_root_ = TmpDir::Create(GetTestTmpDir(), "staging");
        REQUIRE(staging_root_ != nullptr);
    }

    [[nodiscard]] auto CreateCompiler(
        std::vector<std::string> const& matches = {}) const
        -> expected<ReleaseCompiler, CompileError> {
        return ReleaseCompiler::Create("dev_releases/demo-1.yml",
                                       Blobstore(),
                                       matches,
                                       ReleaseDir(),
                                       staging_root_->GetPath());
    }

    std::string p1_sha1_;
    std::string j1_sha1_;
    nlohmann::json manifest_;
    std::filesystem::path manifest_file_;
    TmpDir::Ptr staging_root_;
};

TEST_CASE_METHOD(CompilerFixture, "Compile a release", "[release]") {
    auto compiler = CreateCompiler();
    REQUIRE(compiler);
    auto const expected_tarball =
        ReleaseDir() / "dev_releases" / "demo-1.tgz";
    CHECK(compiler->TarballPath() == expected_tarball);
    CHECK_FALSE(compiler->Exists());
    CHECK(FileSystemManager::IsDirectory(compiler->StagingDirectory() /
                                         "packages"));
    CHECK(FileSystemManager::IsDirectory(compiler->StagingDirectory() /
                                         "jobs"));

    auto result = compiler->Compile();
    REQUIRE(result);
    CHECK(result->status == CompileResult::Status::Built);
    CHECK(result->tarball_path == expected_tarball);
    CHECK(result->size > 0);
    CHECK(result->copied_packages == std::vector<std::string>{"p1"});
    CHECK(result->copied_jobs == std::vector<std::string>{"j1"});
    CHECK(result->skipped_packages.empty());
    CHECK(compiler->Exists());

    auto files = FileEntries(expected_tarball);
    std::sort(files.begin(), files.end());
    CHECK(files == std::vector<std::string>{
                       "jobs/j1.tgz", "packages/p1.tgz", "release.MF"});

    SECTION("second run leaves the tarball alone") {
        auto const size = FileSystemManager::FileSize(expected_tarball);
        auto again = CreateCompiler();
        REQUIRE(again);
        auto second = again->Compile();
        REQUIRE(second);
        CHECK(second->status == CompileResult::Status::AlreadyExists);
        CHECK(second->copied_packages.empty());
        CHECK(FileSystemManager::FileSize(expected_tarball) == size);
        CHECK(Blobstore()->Fetches() == 2);
    }

    SECTION("staging directory is removed with the compiler") {
        std::filesystem::path staging{};
        {
            auto other = CreateCompiler();
            REQUIRE(other);
            staging = other->StagingDirectory();
            REQUIRE(FileSystemManager::Exists(staging));
        }
        CHECK_FALSE(FileSystemManager::Exists(staging));
    }
}

TEST_CASE_METHOD(CompilerFixture, "Compile with known packages", "[release]") {
    SECTION("match by checksum") {
        auto compiler = CreateCompiler({p1_sha1_});
        REQUIRE(compiler);
        CHECK(compiler->RemotePackageExists(compiler->Manifest().Packages()[0]));
        auto result = compiler->Compile();
        REQUIRE(result);
        CHECK(result->skipped_packages == std::vector<std::string>{"p1"});
        CHECK(result->copied_packages.empty());
        CHECK(FileEntries(result->tarball_path) ==
              std::vector<std::string>{"jobs/j1.tgz", "release.MF"});
        // the package was never resolved
        CHECK(Blobstore()->Fetches() == 1);
    }

    SECTION("match by checksum in upper case") {
        std::string upper{p1_sha1_};
        std::transform(
            upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
                return static_cast<char>(std::toupper(c));
            });
        auto compiler = CreateCompiler({upper});
        REQUIRE(compiler);
        auto result = compiler->Compile();
        REQUIRE(result);
        CHECK(result->skipped_packages == std::vector<std::string>{"p1"});
    }

    SECTION("match by fingerprint") {
        auto compiler = CreateCompiler({"fp1"});
        REQUIRE(compiler);
        auto result = compiler->Compile();
        REQUIRE(result);
        CHECK(result->skipped_packages == std::vector<std::string>{"p1"});
    }

    SECTION("jobs are always included") {
        auto compiler = CreateCompiler({j1_sha1_});
        REQUIRE(compiler);
        CHECK_FALSE(compiler->RemoteJobExists(compiler->Manifest().Jobs()[0]));
        auto result = compiler->Compile();
        REQUIRE(result);
        CHECK(result->copied_jobs == std::vector<std::string>{"j1"});
    }
}

TEST_CASE_METHOD(CompilerFixture, "Compile failures", "[release]") {
    SECTION("explicit tarball path") {
        auto compiler = CreateCompiler();
        REQUIRE(compiler);
        auto const target = staging_root_->GetPath() / "out" / "release.tgz";
        compiler->SetTarballPath(target);
        CHECK(compiler->TarballPath() == target);
        auto result = compiler->Compile();
        REQUIRE(result);
        CHECK(FileSystemManager::IsFile(target));
        CHECK_FALSE(FileSystemManager::Exists(ReleaseDir() / "dev_releases" /
                                              "demo-1.tgz"));
    }

    SECTION("missing artifact produces no tarball") {
        manifest_["packages"][0]["sha1"] = "0000";
        WriteManifest("dev_releases/demo-1.yml", manifest_);
        auto compiler = CreateCompiler();
        REQUIRE(compiler);
        auto result = compiler->Compile();
        REQUIRE_FALSE(result);
        CHECK(result.error().kind == CompileErrorKind::ArtifactNotFound);
        CHECK_FALSE(compiler->Exists());
    }

    SECTION("archive failure produces no tarball") {
        auto const blocker = staging_root_->GetPath() / "blocker";
        REQUIRE(FileSystemManager::WriteFile("not a directory", blocker));
        auto compiler = CreateCompiler();
        REQUIRE(compiler);
        compiler->SetTarballPath(blocker / "release.tgz");
        auto result = compiler->Compile();
        REQUIRE_FALSE(result);
        CHECK(result.error().kind == CompileErrorKind::ArchiveCreationFailed);
        CHECK_FALSE(compiler->Exists());
        CHECK(FileSystemManager::IsFile(blocker));
    }

    SECTION("blobstore failure produces no tarball") {
        Blobstore()->SetUnreachable(true);
        auto compiler = CreateCompiler();
        REQUIRE(compiler);
        auto result = compiler->Compile();
        REQUIRE_FALSE(result);
        CHECK(result.error().kind == CompileErrorKind::BlobstoreError);
        CHECK_FALSE(compiler->Exists());
    }

    SECTION("invalid manifest") {
        REQUIRE(FileSystemManager::WriteFile("{\"name\": \"demo\"}",
                                             manifest_file_));
        auto compiler = CreateCompiler();
        REQUIRE_FALSE(compiler);
        CHECK(compiler.error().kind == CompileErrorKind::InvalidManifest);
    }
}

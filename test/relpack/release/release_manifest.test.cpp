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

#include "src/relpack/release/release_manifest.hpp"

#include "catch2/catch_test_macros.hpp"
#include "nlohmann/json.hpp"
#include "src/relpack/file_system/file_system_manager.hpp"
#include "src/utils/cpp/tmp_dir.hpp"
#include "test/utils/test_env.hpp"

TEST_CASE("Release manifest", "[release]") {
    auto const manifest_json = nlohmann::json::parse(R"({
        "name": "demo",
        "version": 1,
        "packages": [
          {"name": "p1", "version": "0.3", "sha1": "abc", "fingerprint": "fp1"},
          {"name": "p2", "version": 2, "sha1": "def", "fingerprint": null}
        ],
        "jobs": [{"name": "j1", "version": "7", "sha1": "123"}]
      })");

    SECTION("valid manifest") {
        auto manifest = ReleaseManifest::FromJson(manifest_json);
        REQUIRE(manifest);
        CHECK(manifest->Name() == "demo");
        CHECK(manifest->Version() == "1");
        CHECK(manifest->TarballName() == "demo-1.tgz");
        REQUIRE(manifest->Packages().size() == 2);
        CHECK(manifest->Packages()[0].fingerprint == "fp1");
        CHECK(manifest->Packages()[1].version == "2");
        CHECK_FALSE(manifest->Packages()[1].fingerprint);
        REQUIRE(manifest->Jobs().size() == 1);
        CHECK(manifest->Jobs()[0].sha1 == "123");
    }

    SECTION("load from file") {
        auto tmp = TmpDir::Create(GetTestTmpDir(), "manifest");
        REQUIRE(tmp != nullptr);
        auto const file = tmp->GetPath() / "dev_releases" / "demo-1.yml";
        REQUIRE(FileSystemManager::WriteFile(manifest_json.dump(), file));
        auto manifest = ReleaseManifest::Load(file);
        REQUIRE(manifest);
        CHECK(manifest->Name() == "demo");

        CHECK_FALSE(ReleaseManifest::Load(tmp->GetPath() / "missing.yml"));
        REQUIRE(FileSystemManager::WriteFile("{", file));
        CHECK_FALSE(ReleaseManifest::Load(file));
    }

    SECTION("missing fields") {
        for (auto const* field : {"name", "version", "packages", "jobs"}) {
            auto json = manifest_json;
            json.erase(field);
            CHECK_FALSE(ReleaseManifest::FromJson(json));
        }
        auto json = manifest_json;
        json["packages"][0].erase("sha1");
        CHECK_FALSE(ReleaseManifest::FromJson(json));
    }

    SECTION("artifact names must be plain file names") {
        auto json = manifest_json;
        json["jobs"][0]["name"] = "../j1";
        CHECK_FALSE(ReleaseManifest::FromJson(json));
    }

    SECTION("release name and version must be plain file names") {
        auto json = manifest_json;
        json["name"] = "../../x";
        CHECK_FALSE(ReleaseManifest::FromJson(json));
        json = manifest_json;
        json["version"] = "1/../../x";
        CHECK_FALSE(ReleaseManifest::FromJson(json));
    }

    SECTION("checksums must be hex strings") {
        auto json = manifest_json;
        json["packages"][1]["sha1"] = "not-a-checksum";
        CHECK_FALSE(ReleaseManifest::FromJson(json));
        json["packages"][1]["sha1"] = "";
        CHECK_FALSE(ReleaseManifest::FromJson(json));
        json["packages"][1]["sha1"] = "DEF";
        CHECK(ReleaseManifest::FromJson(json));
    }

    SECTION("empty release") {
        auto manifest = ReleaseManifest::FromJson(nlohmann::json::parse(
            R"({"name": "empty", "version": "0", "packages": [], "jobs": []})"));
        REQUIRE(manifest);
        CHECK(manifest->Packages().empty());
        CHECK(manifest->Jobs().empty());
    }
}

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

#include <memory>
#include <string>

#include "catch2/catch_test_macros.hpp"
#include "src/relpack/blobstore/blobstore_client.hpp"
#include "src/relpack/blobstore/blobstore_factory.hpp"
#include "src/relpack/blobstore/config.hpp"
#include "src/relpack/blobstore/local_blobstore_client.hpp"
#include "src/relpack/blobstore/simple_blobstore_client.hpp"
#include "src/relpack/file_system/file_system_manager.hpp"
#include "src/utils/cpp/tmp_dir.hpp"
#include "test/utils/test_env.hpp"

TEST_CASE("Local blobstore client", "[blobstore]") {
    auto tmp = TmpDir::Create(GetTestTmpDir(), "blobstore");
    REQUIRE(tmp != nullptr);
    REQUIRE(FileSystemManager::WriteFile("blob content",
                                         tmp->GetPath() / "0b6a"));
    LocalBlobstoreClient client{tmp->GetPath()};

    SECTION("existing object") {
        auto content = client.Fetch("0b6a");
        REQUIRE(content);
        CHECK(*content == "blob content");
    }

    SECTION("unknown object") {
        auto content = client.Fetch("ffff");
        REQUIRE_FALSE(content);
        CHECK(content.error().kind == BlobstoreFetchError::Kind::NotFound);
    }

    SECTION("ids cannot leave the store") {
        auto content = client.Fetch("../0b6a");
        REQUIRE_FALSE(content);
        CHECK(content.error().kind == BlobstoreFetchError::Kind::NotFound);
    }
}

TEST_CASE("Simple blobstore client", "[blobstore]") {
    SECTION("resource urls") {
        SimpleBlobstoreClient client{SimpleBlobstoreClient::Options{
            .endpoint = "http://blobs.example.com:25250/"}};
        CHECK(client.ResourceUrl("0b6a") ==
              "http://blobs.example.com:25250/resources/0b6a");
    }

    SECTION("unreachable endpoint is a transport error") {
        // nothing listens on the discard port
        SimpleBlobstoreClient client{
            SimpleBlobstoreClient::Options{.endpoint = "http://127.0.0.1:9"}};
        auto content = client.Fetch("0b6a");
        REQUIRE_FALSE(content);
        CHECK(content.error().kind == BlobstoreFetchError::Kind::Transport);
    }
}

TEST_CASE("Blobstore configuration", "[blobstore]") {
    SECTION("local requires a path") {
        CHECK_FALSE(BlobstoreConfig::Builder{}.SetProvider("local").Build());
        auto config = BlobstoreConfig::Builder{}
                          .SetProvider("local")
                          .SetBlobstorePath("/srv/blobs")
                          .Build();
        REQUIRE(config);
        CHECK(config->provider == BlobstoreProvider::Local);
        CHECK(config->blobstore_path == "/srv/blobs");
    }

    SECTION("simple requires an endpoint") {
        CHECK_FALSE(BlobstoreConfig::Builder{}.SetProvider("simple").Build());
        auto config = BlobstoreConfig::Builder{}
                          .SetProvider("simple")
                          .SetEndpoint("http://blobs")
                          .SetUser("agent")
                          .SetPassword("secret")
                          .Build();
        REQUIRE(config);
        CHECK(config->provider == BlobstoreProvider::Simple);
        CHECK(config->user == "agent");
    }

    SECTION("password without user") {
        CHECK_FALSE(BlobstoreConfig::Builder{}
                        .SetProvider("simple")
                        .SetEndpoint("http://blobs")
                        .SetPassword("secret")
                        .Build());
    }

    SECTION("unknown provider") {
        auto config = BlobstoreConfig::Builder{}
                          .SetProvider("s3")
                          .SetBlobstorePath("/srv/blobs")
                          .Build();
        CHECK_FALSE(config);
    }

    SECTION("factory selects the client") {
        auto local = BlobstoreConfig::Builder{}
                         .SetProvider("local")
                         .SetBlobstorePath("/srv/blobs")
                         .Build();
        REQUIRE(local);
        auto local_client = CreateBlobstoreClient(*local);
        REQUIRE(local_client != nullptr);
        CHECK(std::dynamic_pointer_cast<LocalBlobstoreClient>(local_client) !=
              nullptr);

        auto simple = BlobstoreConfig::Builder{}
                          .SetProvider("simple")
                          .SetEndpoint("http://blobs")
                          .Build();
        REQUIRE(simple);
        auto simple_client = CreateBlobstoreClient(*simple);
        REQUIRE(simple_client != nullptr);
        CHECK(std::dynamic_pointer_cast<SimpleBlobstoreClient>(
                  simple_client) != nullptr);
    }
}

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

#include "src/relpack/blobstore/blobstore_factory.hpp"

#include <exception>
#include <memory>

#include "src/relpack/blobstore/local_blobstore_client.hpp"
#include "src/relpack/blobstore/simple_blobstore_client.hpp"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/logger.hpp"

auto CreateBlobstoreClient(BlobstoreConfig const& config) noexcept
    -> IBlobstoreClient::Ptr {
    try {
        switch (config.provider) {
            case BlobstoreProvider::Local:
                return std::make_shared<LocalBlobstoreClient>(
                    config.blobstore_path.value_or(std::filesystem::path{}));
            case BlobstoreProvider::Simple:
                return std::make_shared<SimpleBlobstoreClient>(
                    SimpleBlobstoreClient::Options{
                        .endpoint = config.endpoint.value_or(std::string{}),
                        .user = config.user,
                        .password = config.password,
                        .no_ssl_verify = config.no_ssl_verify,
                        .ca_bundle = config.ca_bundle});
        }
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error,
                    "creating blobstore client failed with:\n{}",
                    ex.what());
    }
    return nullptr;
}

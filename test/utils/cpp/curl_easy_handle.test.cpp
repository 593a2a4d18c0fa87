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

#include "src/utils/cpp/curl_easy_handle.hpp"

#include <string>

#include "catch2/catch_test_macros.hpp"

TEST_CASE("Curl verbose output hides credentials", "[utils]") {
    std::string const verbose =
        "*   Trying 127.0.0.1:8080...\n"
        "> GET /resources/b1 HTTP/1.1\r\n"
        "> Host: 127.0.0.1:8080\r\n"
        "> Authorization: Basic dXNlcjpzZWNyZXQ=\r\n"
        "> proxy-authorization: Basic c2VjcmV0\r\n"
        "< HTTP/1.1 500 Internal Server Error\r\n";

    auto redacted = CurlEasyHandle::RedactVerboseLog(verbose);
    CHECK(redacted.find("dXNlcjpzZWNyZXQ=") == std::string::npos);
    CHECK(redacted.find("c2VjcmV0") == std::string::npos);
    CHECK(redacted.find("> Authorization: <redacted>") != std::string::npos);
    CHECK(redacted.find("> Host: 127.0.0.1:8080") != std::string::npos);
    CHECK(redacted.find("500 Internal Server Error") != std::string::npos);

    CHECK(CurlEasyHandle::RedactVerboseLog("") == "");
}

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

#include <string>

#include "catch2/catch_test_macros.hpp"
#include "nlohmann/json.hpp"
#include "src/utils/cpp/hex_string.hpp"
#include "src/utils/cpp/json.hpp"
#include "src/utils/cpp/pretty_size.hpp"

TEST_CASE("Hex strings", "[utils]") {
    CHECK(ToHexString(std::string{"\x01\xab", 2}) == "01ab");
    CHECK(NormalizeHexString("A94A8FE5") == "a94a8fe5");
    CHECK(IsHexString("a94a8fe5"));
    CHECK_FALSE(IsHexString(""));
    CHECK_FALSE(IsHexString("xyz"));
}

TEST_CASE("Pretty sizes", "[utils]") {
    CHECK(PrettySize(0) == "0B");
    CHECK(PrettySize(512) == "512B");
    CHECK(PrettySize(1536) == "1.5K");
    CHECK(PrettySize(20 * 1024 * 1024) == "20.0M");
}

TEST_CASE("Json scalars", "[utils]") {
    CHECK(JsonScalarToString(nlohmann::json("1.2-dev")) == "1.2-dev");
    CHECK(JsonScalarToString(nlohmann::json(3)) == "3");
    CHECK_FALSE(JsonScalarToString(nlohmann::json::array()));
    CHECK_FALSE(JsonScalarToString(nlohmann::json(nullptr)));

    std::string error{};
    auto const object = nlohmann::json::parse(R"({"name": 1})");
    CHECK_FALSE(ExtractValueAs<std::string>(
        object, "name", [&error](auto const& msg) { error = msg; }));
    CHECK_FALSE(error.empty());
}

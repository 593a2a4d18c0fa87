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

#include "src/relpack/logging/logger.hpp"

#include <atomic>
#include <string>
#include <unordered_map>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/relpack/logging/log_config.hpp"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/log_sink.hpp"
#include "test/utils/logging/log_config.hpp"

// Stores prints from test sink instances
class TestPrints {
    struct PrintData {
        std::atomic<int> counter{};
        std::unordered_map<int, std::vector<std::string>> prints{};
    };

  public:
    static void Print(int sink_id, std::string const& print) noexcept {
        Data().prints[sink_id].push_back(print);
    }
    [[nodiscard]] static auto Read(int sink_id) noexcept
        -> std::vector<std::string> {
        return Data().prints[sink_id];
    }

    static void Clear() noexcept {
        Data().prints.clear();
        Data().counter = 0;
    }

    static auto GetId() noexcept -> int { return Data().counter++; }

  private:
    [[nodiscard]] static auto Data() noexcept -> PrintData& {
        static PrintData instance{};
        return instance;
    }
};

// Test sink, prints to TestPrints depending on its own instance id.
class LogSinkTest : public ILogSink {
  public:
    static auto CreateFactory() -> LogSinkFactory {
        return [] { return std::make_shared<LogSinkTest>(); };
    }

    LogSinkTest() noexcept { id_ = TestPrints::GetId(); }

    void Emit(Logger const* logger,
              LogLevel level,
              std::string const& msg) const noexcept final {
        auto prefix = LogLevelToString(level);

        if (logger != nullptr) {
            prefix += " (" + logger->Name() + ")";
        }

        TestPrints::Print(id_, prefix + ": " + msg);
    }

  private:
    int id_{};
};

class OneGlobalSinkFixture {
  public:
    OneGlobalSinkFixture() {
        TestPrints::Clear();
        LogConfig::SetLogLimit(LogLevel::Info);
        LogConfig::SetSinks({LogSinkTest::CreateFactory()});
    }
    OneGlobalSinkFixture(OneGlobalSinkFixture const&) = delete;
    OneGlobalSinkFixture(OneGlobalSinkFixture&&) = delete;
    ~OneGlobalSinkFixture() { ConfigureLogging(); }
    auto operator=(OneGlobalSinkFixture const&)
        -> OneGlobalSinkFixture& = delete;
    auto operator=(OneGlobalSinkFixture&&) -> OneGlobalSinkFixture& = delete;
};

TEST_CASE_METHOD(OneGlobalSinkFixture,
                 "Global static logger with one sink",
                 "[logger]") {
    // logs should be forwarded to sink instance: 0
    int instance = 0;

    // create log outside of log limit
    Logger::Log(LogLevel::Debug, "first");
    CHECK(TestPrints::Read(instance).empty());

    SECTION("create log within log limit") {
        Logger::Log(LogLevel::Info, "copied {} of {}", 1, 2);
        auto prints = TestPrints::Read(instance);
        REQUIRE(prints.size() == 1);
        CHECK(prints[0] == "INFO: copied 1 of 2");

        SECTION("increase log limit create log within log limit") {
            LogConfig::SetLogLimit(LogLevel::Trace);
            Logger::Log(LogLevel::Trace, [] { return std::string{"third"}; });
            auto prints = TestPrints::Read(instance);
            REQUIRE(prints.size() == 2);
            CHECK(prints[1] == "TRACE: third");
        }
    }

    SECTION("messages without arguments are not formatted") {
        Logger::Log(LogLevel::Info, "p{1} (1)");
        auto prints = TestPrints::Read(instance);
        REQUIRE(prints.size() == 1);
        CHECK(prints[0] == "INFO: p{1} (1)");
    }

    SECTION("format errors are reported in the message") {
        Logger::Log(LogLevel::Error, "broken {", 1);
        auto prints = TestPrints::Read(instance);
        REQUIRE(prints.size() == 1);
        CHECK(prints[0].starts_with("ERROR: broken { [format error:"));
    }
}

TEST_CASE_METHOD(OneGlobalSinkFixture,
                 "Local named logger with its own sink instance",
                 "[logger]") {
    // create logger with separate sink instance
    Logger logger("OwnSinkLogger", {LogSinkTest::CreateFactory()});

    // logs should be forwarded to new sink instance: 1
    int instance = 1;

    logger.Emit(LogLevel::Trace, "first");
    CHECK(TestPrints::Read(instance).empty());

    logger.SetLogLimit(LogLevel::Trace);
    logger.Emit(LogLevel::Trace, "second");
    auto prints = TestPrints::Read(instance);
    REQUIRE(prints.size() == 1);
    CHECK(prints[0] == "TRACE (OwnSinkLogger): second");

    // the global sink saw nothing
    CHECK(TestPrints::Read(0).empty());
}

TEST_CASE("Log levels", "[logger]") {
    CHECK(ToLogLevel(-3) == LogLevel::Error);
    CHECK(ToLogLevel(2) == LogLevel::Info);
    CHECK(ToLogLevel(42) == LogLevel::Trace);
    CHECK(LogLevelToString(LogLevel::Progress) == "PROG");
}

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

#ifndef INCLUDED_SRC_RELPACK_LOGGING_LOG_LEVEL_HPP
#define INCLUDED_SRC_RELPACK_LOGGING_LOG_LEVEL_HPP

#include <algorithm>
#include <cstdint>
#include <string>

#include "gsl/gsl"

enum class LogLevel : std::uint8_t {
    Error,     ///< Error messages, fatal errors
    Warning,   ///< Warning messages, recoverable situations that shouldn't occur
    Info,      ///< Informative messages, such as the per-artifact report
    Progress,  ///< Information about ongoing downloads and copies
    Debug,     ///< Debug messages, such as index lookups and cache hits
    Trace      ///< Trace messages, verbose details such as curl output
};

constexpr auto kFirstLogLevel = LogLevel::Error;
constexpr auto kLastLogLevel = LogLevel::Trace;
constexpr auto kDefaultLogLevel = LogLevel::Info;

/// \brief Clamp an integral verbosity into the range of known log levels.
[[nodiscard]] static inline auto ToLogLevel(int level) -> LogLevel {
    auto const clamped = std::clamp(level,
                                    static_cast<int>(kFirstLogLevel),
                                    static_cast<int>(kLastLogLevel));
    return static_cast<LogLevel>(clamped);
}

[[nodiscard]] static inline auto LogLevelToString(LogLevel level)
    -> std::string {
    switch (level) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Progress:
            return "PROG";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
    }
    Ensures(false);  // unreachable
}

#endif  // INCLUDED_SRC_RELPACK_LOGGING_LOG_LEVEL_HPP

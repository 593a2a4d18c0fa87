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

#ifndef INCLUDED_SRC_UTILS_CPP_CURL_EASY_HANDLE_HPP
#define INCLUDED_SRC_UTILS_CPP_CURL_EASY_HANDLE_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "gsl/gsl"
#include "src/utils/cpp/curl_context.hpp"
#include "src/utils/cpp/expected.hpp"

extern "C" {
#if defined(BUILDING_LIBCURL) || defined(CURL_STRICTER)
using CURL = struct Curl_easy;
#else
using CURL = void;
#endif
}

void curl_easy_closer(gsl::owner<CURL*> curl);

/// \brief Single libcurl easy handle for blocking HTTP downloads.
class CurlEasyHandle {
  public:
    CurlEasyHandle() noexcept = default;
    ~CurlEasyHandle() noexcept = default;

    // prohibit moves and copies
    CurlEasyHandle(CurlEasyHandle const&) = delete;
    CurlEasyHandle(CurlEasyHandle&& other) = delete;
    auto operator=(CurlEasyHandle const&) = delete;
    auto operator=(CurlEasyHandle&& other) = delete;

    /// \brief Create a handle, optionally with non-default SSL settings.
    [[nodiscard]] static auto Create(
        bool no_ssl_verify = false,
        std::optional<std::filesystem::path> const& ca_bundle =
            std::nullopt) noexcept -> std::shared_ptr<CurlEasyHandle>;

    /// \brief Use HTTP basic authentication for subsequent downloads.
    void SetBasicAuth(std::string user, std::string password) noexcept;

    /// \brief Download URL content into a string as binary.
    /// HTTP statuses of 400 and above are reported as errors; the status is
    /// available afterwards via \ref ResponseCode.
    /// \returns the content or an error message including curl's output.
    [[nodiscard]] auto DownloadToString(std::string const& url) noexcept
        -> expected<std::string, std::string>;

    /// \brief Mask the values of authorization headers in curl's verbose
    /// output, which is otherwise passed on into logs and error messages.
    [[nodiscard]] static auto RedactVerboseLog(std::string const& log)
        -> std::string;

    /// \brief HTTP status of the last transfer, 0 if none was received.
    [[nodiscard]] auto ResponseCode() const noexcept -> long {  // NOLINT
        return response_code_;
    }

  private:
    // IMPORTANT: the CurlContext must to be initialized before any curl object!
    CurlContext curl_context_;
    std::unique_ptr<CURL, decltype(&curl_easy_closer)> handle_{
        nullptr,
        curl_easy_closer};

    bool no_ssl_verify_{false};
    std::optional<std::filesystem::path> ca_bundle_{std::nullopt};
    std::optional<std::string> user_{};
    std::optional<std::string> password_{};
    long response_code_{};  // NOLINT(google-runtime-int)

    [[nodiscard]] static auto EasyWriteToString(char* data,
                                                std::size_t size,
                                                std::size_t nmemb,
                                                void* userptr) -> std::size_t;
};

#endif  // INCLUDED_SRC_UTILS_CPP_CURL_EASY_HANDLE_HPP

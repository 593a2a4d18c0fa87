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

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <exception>
#include <sstream>
#include <utility>

#include "fmt/core.h"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/logger.hpp"

extern "C" {
#include "curl/curl.h"
}

void curl_easy_closer(gsl::owner<CURL*> curl) {
    curl_easy_cleanup(curl);
}

namespace {

constexpr long kFirstHttpErrorStatus = 400;  // NOLINT(google-runtime-int)

/// \brief Read back what curl wrote to its stderr replacement.
auto ReadStreamData(gsl::not_null<std::FILE*> const& stream) noexcept
    -> std::string {
    std::fseek(stream, 0, SEEK_END);
    auto size = std::ftell(stream);
    if (size <= 0) {
        return std::string{};
    }
    std::rewind(stream);
    std::string content(static_cast<std::size_t>(size), '\0');
    auto n = std::fread(content.data(), 1, content.size(), stream);
    content.resize(n);
    return content;
}

/// \brief Owning wrapper for the temporary file capturing curl's verbose log.
struct TmpFileCloser {
    void operator()(gsl::owner<std::FILE*> file) const noexcept {
        std::fclose(file);
    }
};

}  // namespace

auto CurlEasyHandle::Create(
    bool no_ssl_verify,
    std::optional<std::filesystem::path> const& ca_bundle) noexcept
    -> std::shared_ptr<CurlEasyHandle> {
    try {
        auto curl = std::make_shared<CurlEasyHandle>();
        if (not curl->curl_context_.Initialized()) {
            return nullptr;
        }
        auto* handle = curl_easy_init();
        if (handle == nullptr) {
            Logger::Log(LogLevel::Error, "curl_easy_init failed");
            return nullptr;
        }
        curl->handle_.reset(handle);
        curl->no_ssl_verify_ = no_ssl_verify;
        curl->ca_bundle_ = ca_bundle;
        return curl;
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error,
                    "create curl easy handle failed with:\n{}",
                    ex.what());
        return nullptr;
    }
}

auto CurlEasyHandle::RedactVerboseLog(std::string const& log)
    -> std::string {
    std::istringstream in{log};
    std::ostringstream out{};
    std::string line{};
    while (std::getline(in, line)) {
        std::string lower{line};
        std::transform(
            lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
        if (auto pos = lower.find("authorization:"); pos != std::string::npos) {
            line = line.substr(0, pos + sizeof("authorization:") - 1) +
                   " <redacted>";
        }
        out << line << '\n';
    }
    return out.str();
}

void CurlEasyHandle::SetBasicAuth(std::string user,
                                  std::string password) noexcept {
    user_ = std::move(user);
    password_ = std::move(password);
}

auto CurlEasyHandle::EasyWriteToString(char* data,
                                       std::size_t size,
                                       std::size_t nmemb,
                                       void* userptr) -> std::size_t {
    std::size_t actual_size = size * nmemb;
    try {
        (static_cast<std::string*>(userptr))->append(data, actual_size);
    } catch (std::exception const& /*unused*/) {
        // a short count makes curl abort the transfer with CURLE_WRITE_ERROR
        return 0;
    }
    return actual_size;
}

auto CurlEasyHandle::DownloadToString(std::string const& url) noexcept
    -> expected<std::string, std::string> {
    response_code_ = 0;
    std::unique_ptr<std::FILE, TmpFileCloser> tmp_file{std::tmpfile()};
    if (not tmp_file) {
        return unexpected<std::string>{
            "could not create temporary file for curl output"};
    }
    try {
        auto* handle = handle_.get();
        // NOLINTBEGIN(cppcoreguidelines-pro-type-vararg, hicpp-vararg)
        curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
        // ensure redirects are allowed, otherwise it might simply read empty
        curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);

        std::string content{};
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, EasyWriteToString);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, static_cast<void*>(&content));

        curl_easy_setopt(handle, CURLOPT_VERBOSE, 1L);
        curl_easy_setopt(handle, CURLOPT_STDERR, tmp_file.get());

        curl_easy_setopt(handle,
                         CURLOPT_SSL_VERIFYPEER,
                         static_cast<long>(not no_ssl_verify_));  // NOLINT
        curl_easy_setopt(handle,
                         CURLOPT_SSL_VERIFYHOST,
                         no_ssl_verify_ ? 0L : 2L);  // NOLINT
        if (ca_bundle_) {
            curl_easy_setopt(handle, CURLOPT_CAINFO, ca_bundle_->c_str());
        }
        if (user_) {
            curl_easy_setopt(handle, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
            curl_easy_setopt(handle, CURLOPT_USERNAME, user_->c_str());
            curl_easy_setopt(handle,
                             CURLOPT_PASSWORD,
                             password_ ? password_->c_str() : "");
        }

        auto res = curl_easy_perform(handle);
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response_code_);
        // NOLINTEND(cppcoreguidelines-pro-type-vararg, hicpp-vararg)

        if (res != CURLE_OK) {
            return unexpected{fmt::format("curl download of {} failed: {}\n{}",
                                          url,
                                          curl_easy_strerror(res),
                                          RedactVerboseLog(ReadStreamData(
                                              tmp_file.get())))};
        }
        if (response_code_ >= kFirstHttpErrorStatus) {
            return unexpected{fmt::format(
                "curl download of {} returned HTTP status {}",
                url,
                response_code_)};
        }

        // print curl debug output if log level is tracing
        Logger::Log(LogLevel::Trace, [&tmp_file]() {
            return fmt::format(
                "stderr of curl downloading to string:\n{}",
                RedactVerboseLog(ReadStreamData(tmp_file.get())));
        });
        return content;
    } catch (std::exception const& ex) {
        return unexpected{
            fmt::format("curl download of {} failed with:\n{}", url, ex.what())};
    }
}

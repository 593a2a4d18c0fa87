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

#include "src/relpack/crypto/hasher.hpp"

#include <array>
#include <exception>
#include <fstream>
#include <string_view>
#include <variant>

#include "gsl/gsl"
#include "openssl/sha.h"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/logger.hpp"

// SHA*_CTX are typedefs and cannot be forward declared, hence the wrapper.
using VariantContext = std::variant<SHA_CTX>;
struct Hasher::ShaContext final : VariantContext {
    using VariantContext::VariantContext;
};

namespace {
inline constexpr int kOpenSslTrue = 1;
inline constexpr std::size_t kCharsPerByte = 2;
inline constexpr std::size_t kFileChunkSize = 64 * 1024;

[[nodiscard]] auto CreateShaContext(Hasher::HashType type) noexcept
    -> std::unique_ptr<Hasher::ShaContext> {
    switch (type) {
        case Hasher::HashType::SHA1:
            return std::make_unique<Hasher::ShaContext>(SHA_CTX{});
    }
    return nullptr;  // make gcc happy
}

struct InitializeVisitor final {
    // NOLINTNEXTLINE(google-runtime-references)
    [[nodiscard]] auto operator()(SHA_CTX& ctx) const -> bool {
        return SHA1_Init(&ctx) == kOpenSslTrue;
    }
};

struct UpdateVisitor final {
    std::string_view data;

    // NOLINTNEXTLINE(google-runtime-references)
    [[nodiscard]] auto operator()(SHA_CTX& ctx) const -> bool {
        return SHA1_Update(&ctx, data.data(), data.size()) == kOpenSslTrue;
    }
};

struct FinalizeVisitor final {
    // NOLINTNEXTLINE(google-runtime-references)
    [[nodiscard]] auto operator()(SHA_CTX& ctx) const
        -> std::optional<std::string> {
        auto out = std::array<unsigned char, SHA_DIGEST_LENGTH>{};
        if (SHA1_Final(out.data(), &ctx) == kOpenSslTrue) {
            return std::string{out.begin(), out.end()};
        }
        return std::nullopt;
    }
};

struct LengthVisitor final {
    [[nodiscard]] constexpr auto operator()(SHA_CTX const& /*unused*/) const
        -> std::size_t {
        return SHA_DIGEST_LENGTH * kCharsPerByte;
    }
};
}  // namespace

Hasher::Hasher(std::unique_ptr<ShaContext> sha_ctx) noexcept
    : sha_ctx_{std::move(sha_ctx)} {}

// Defaulted out of line, as ShaContext is incomplete in the header.
Hasher::Hasher(Hasher&& other) noexcept = default;
auto Hasher::operator=(Hasher&& other) noexcept -> Hasher& = default;
Hasher::~Hasher() noexcept = default;

auto Hasher::Create(HashType type) noexcept -> std::optional<Hasher> {
    auto sha_ctx = CreateShaContext(type);
    if (sha_ctx != nullptr and std::visit(InitializeVisitor{}, *sha_ctx)) {
        return std::optional<Hasher>{Hasher{std::move(sha_ctx)}};
    }
    Logger::Log(LogLevel::Error, "Failed to initialize hasher.");
    return std::nullopt;
}

auto Hasher::HashData(HashType type, std::string const& data) noexcept
    -> std::optional<std::string> {
    auto hasher = Create(type);
    if (not hasher or not hasher->Update(data)) {
        return std::nullopt;
    }
    auto digest = std::move(*hasher).Finalize();
    if (not digest) {
        return std::nullopt;
    }
    return digest->HexString();
}

auto Hasher::HashFile(HashType type, std::filesystem::path const& path) noexcept
    -> std::optional<std::string> {
    auto hasher = Create(type);
    if (not hasher) {
        return std::nullopt;
    }
    try {
        std::ifstream in{path, std::ios::binary};
        if (not in.is_open()) {
            Logger::Log(LogLevel::Error,
                        "Hasher: cannot open file {}",
                        path.string());
            return std::nullopt;
        }
        std::string chunk(kFileChunkSize, '\0');
        while (in) {
            in.read(chunk.data(), gsl::narrow<std::streamsize>(chunk.size()));
            auto const count = gsl::narrow<std::size_t>(in.gcount());
            if (count > 0 and
                not hasher->Update(std::string{chunk.data(), count})) {
                return std::nullopt;
            }
        }
        if (in.bad()) {
            Logger::Log(LogLevel::Error,
                        "Hasher: failed reading file {}",
                        path.string());
            return std::nullopt;
        }
        auto digest = std::move(*hasher).Finalize();
        if (not digest) {
            return std::nullopt;
        }
        return digest->HexString();
    } catch (std::exception const& e) {
        Logger::Log(LogLevel::Error,
                    "Hasher: hashing file {} failed with:\n{}",
                    path.string(),
                    e.what());
        return std::nullopt;
    }
}

auto Hasher::Update(std::string const& data) noexcept -> bool {
    return std::visit(UpdateVisitor{data}, *sha_ctx_);
}

auto Hasher::Finalize() && noexcept -> std::optional<HashDigest> {
    if (auto hash = std::visit(FinalizeVisitor{}, *sha_ctx_)) {
        return HashDigest{std::move(*hash)};
    }
    Logger::Log(LogLevel::Error, "Failed to compute hash.");
    return std::nullopt;
}

auto Hasher::GetHashLength() const noexcept -> std::size_t {
    return std::visit(LengthVisitor{}, *sha_ctx_);
}

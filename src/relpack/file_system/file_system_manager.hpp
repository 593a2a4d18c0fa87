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

#ifndef INCLUDED_SRC_RELPACK_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP
#define INCLUDED_SRC_RELPACK_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

#ifdef __unix__
#include <unistd.h>
#else
#error "Non-unix is not supported yet"
#endif

#include "gsl/gsl"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/logger.hpp"

/// \brief Implements primitive file system functionality.
/// Catches all exceptions for use with exception-free callers.
class FileSystemManager {
  public:
    [[nodiscard]] static auto GetCurrentDirectory() noexcept
        -> std::filesystem::path {
        try {
            return std::filesystem::current_path();
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error, e.what());
            return std::filesystem::path{};
        }
    }

    /// \brief Returns true if the directory was created or existed before.
    [[nodiscard]] static auto CreateDirectory(
        std::filesystem::path const& dir) noexcept -> bool {
        try {
            if (std::filesystem::is_directory(
                    std::filesystem::symlink_status(dir))) {
                return true;
            }
            if (std::filesystem::create_directories(dir)) {
                return true;
            }
            // another process might have created it concurrently
            return std::filesystem::is_directory(
                std::filesystem::symlink_status(dir));
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "creating directory {}:\n{}",
                        dir.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto Rename(std::filesystem::path const& src,
                                     std::filesystem::path const& dst) noexcept
        -> bool {
        try {
            std::filesystem::rename(src, dst);
            return true;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "renaming {} to {}:\n{}",
                        src.string(),
                        dst.string(),
                        e.what());
            return false;
        }
    }

    /// \brief Copy a regular file, overwriting the destination. Permissions
    /// and modification time of the source are carried over.
    [[nodiscard]] static auto CopyFile(
        std::filesystem::path const& src,
        std::filesystem::path const& dst) noexcept -> bool {
        try {
            if (not IsFile(src)) {
                Logger::Log(LogLevel::Error,
                            "cannot copy {}: not a regular file",
                            src.string());
                return false;
            }
            if (not RemoveFile(dst)) {
                Logger::Log(
                    LogLevel::Error, "cannot remove file {}", dst.string());
                return false;
            }
            if (not std::filesystem::copy_file(src, dst)) {
                return false;
            }
            std::filesystem::permissions(
                dst, std::filesystem::status(src).permissions());
            std::filesystem::last_write_time(
                dst, std::filesystem::last_write_time(src));
            return true;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "copying file from {} to {}:\n{}",
                        src.string(),
                        dst.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto RemoveFile(
        std::filesystem::path const& file) noexcept -> bool {
        try {
            auto status = std::filesystem::symlink_status(file);
            if (not std::filesystem::exists(status)) {
                return true;
            }
            if (not std::filesystem::is_regular_file(status) and
                not std::filesystem::is_symlink(status)) {
                return false;
            }
            return std::filesystem::remove(file);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "removing file from {}:\n{}",
                        file.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto RemoveDirectory(std::filesystem::path const& dir,
                                              bool recursively = false) noexcept
        -> bool {
        try {
            auto status = std::filesystem::symlink_status(dir);
            if (not std::filesystem::exists(status)) {
                return true;
            }
            if (not std::filesystem::is_directory(status)) {
                return false;
            }
            if (recursively) {
                return (std::filesystem::remove_all(dir) !=
                        static_cast<std::uintmax_t>(-1));
            }
            return std::filesystem::remove(dir);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "removing directory {}:\n{}",
                        dir.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto Exists(std::filesystem::path const& path) noexcept
        -> bool {
        try {
            auto const status = std::filesystem::symlink_status(path);
            return std::filesystem::exists(status);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "checking for existence of path {}:\n{}",
                        path.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto IsFile(std::filesystem::path const& file) noexcept
        -> bool {
        try {
            return std::filesystem::is_regular_file(
                std::filesystem::symlink_status(file));
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "checking if path {} corresponds to a file:\n{}",
                        file.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto IsDirectory(
        std::filesystem::path const& dir) noexcept -> bool {
        try {
            return std::filesystem::is_directory(
                std::filesystem::symlink_status(dir));
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "checking if path {} corresponds to a directory:\n{}",
                        dir.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto FileSize(
        std::filesystem::path const& file) noexcept
        -> std::optional<std::uintmax_t> {
        try {
            return std::filesystem::file_size(file);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "getting size of file {}:\n{}",
                        file.string(),
                        e.what());
            return std::nullopt;
        }
    }

    [[nodiscard]] static auto ReadFile(
        std::filesystem::path const& file) noexcept
        -> std::optional<std::string> {
        if (not IsFile(file)) {
            Logger::Log(LogLevel::Debug,
                        "{} can not be read because it is not a file.",
                        file.string());
            return std::nullopt;
        }
        try {
            std::string chunk{};
            std::string content{};
            chunk.resize(kChunkSize);
            std::ifstream file_reader(file.string(), std::ios::binary);
            if (not file_reader.is_open()) {
                return std::nullopt;
            }
            auto ssize = gsl::narrow<std::streamsize>(chunk.size());
            do {
                file_reader.read(chunk.data(), ssize);
                auto count = file_reader.gcount();
                content.append(chunk, 0, gsl::narrow<std::size_t>(count));
            } while (file_reader.good());
            file_reader.close();
            return content;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "reading file {}:\n{}",
                        file.string(),
                        e.what());
            return std::nullopt;
        }
    }

    /// \brief Write content to file, creating parent directories.
    [[nodiscard]] static auto WriteFile(
        std::string const& content,
        std::filesystem::path const& file) noexcept -> bool {
        if (not CreateDirectory(file.parent_path())) {
            Logger::Log(LogLevel::Error,
                        "can not create directory {}",
                        file.parent_path().string());
            return false;
        }
        if (not RemoveFile(file)) {
            Logger::Log(
                LogLevel::Error, "can not remove file {}", file.string());
            return false;
        }
        try {
            std::ofstream writer{file, std::ios::binary};
            if (not writer.is_open()) {
                Logger::Log(
                    LogLevel::Error, "can not open file {}", file.string());
                return false;
            }
            writer << content;
            writer.close();
            return writer.good();
        } catch (std::exception const& e) {
            Logger::Log(
                LogLevel::Error, "writing to {}:\n{}", file.string(), e.what());
            return false;
        }
    }

    /// \brief Write content to a unique temporary file next to the target and
    /// rename it into place. Readers never observe a partially written file.
    [[nodiscard]] static auto WriteFileAtomic(
        std::string const& content,
        std::filesystem::path const& file) noexcept -> bool {
        if (not CreateDirectory(file.parent_path())) {
            Logger::Log(LogLevel::Error,
                        "can not create directory {}",
                        file.parent_path().string());
            return false;
        }
        auto tmp_file = CreateUniqueFile(file.parent_path(),
                                         file.filename().string() + ".tmp");
        if (not tmp_file) {
            return false;
        }
        if (WriteFile(content, *tmp_file) and Rename(*tmp_file, file)) {
            return true;
        }
        if (not RemoveFile(*tmp_file)) {
            Logger::Log(LogLevel::Warning,
                        "could not clean up temporary file {}",
                        tmp_file->string());
        }
        return false;
    }

  private:
    static constexpr std::size_t kChunkSize{4096};

    /// \brief Create an empty file with a unique name in the given directory.
    [[nodiscard]] static auto CreateUniqueFile(
        std::filesystem::path const& dir,
        std::string const& name_prefix) noexcept
        -> std::optional<std::filesystem::path> {
        try {
            auto path = (dir / (name_prefix + ".XXXXXX")).string();
            auto fd = mkstemp(path.data());
            if (fd == -1) {
                Logger::Log(LogLevel::Error,
                            "could not create unique file in {}",
                            dir.string());
                return std::nullopt;
            }
            ::close(fd);
            return std::filesystem::path{path};
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "creating unique file in {}:\n{}",
                        dir.string(),
                        e.what());
            return std::nullopt;
        }
    }
};

#endif  // INCLUDED_SRC_RELPACK_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP

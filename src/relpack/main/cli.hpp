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

#ifndef INCLUDED_SRC_RELPACK_MAIN_CLI_HPP
#define INCLUDED_SRC_RELPACK_MAIN_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "CLI/CLI.hpp"
#include "fmt/core.h"
#include "gsl/gsl"
#include "src/relpack/logging/log_level.hpp"

/// \brief Arguments common to all relpack subcommands
struct RelpackCommonArguments {
    std::optional<std::filesystem::path> release_dir{std::nullopt};
    std::optional<std::filesystem::path> tmp_dir{std::nullopt};
};

struct RelpackLogArguments {
    std::vector<std::filesystem::path> log_files;
    std::optional<LogLevel> log_limit;
    std::optional<LogLevel> restrict_stderr_log_limit;
    bool plain_log{false};
    bool log_append{false};
};

/// \brief Command-line overrides of the release's blobstore configuration
struct RelpackBlobstoreArguments {
    std::optional<std::filesystem::path> blobstore_path{std::nullopt};
    std::optional<std::string> endpoint{std::nullopt};
    bool no_ssl_verify{false};
    std::optional<std::filesystem::path> ca_bundle{std::nullopt};
};

struct RelpackCompileArguments {
    std::filesystem::path manifest;
    std::optional<std::filesystem::path> tarball{std::nullopt};
    std::vector<std::string> package_matches;
    std::optional<std::filesystem::path> package_matches_file{std::nullopt};
};

struct RelpackLocateArguments {
    std::string kind{"package"};
    std::string name;
    std::string sha1;
    std::string version{"?"};
};

enum class SubCommand : std::uint8_t { kUnknown, kVersion, kCompile, kLocate };

struct CommandLineArguments {
    SubCommand cmd{SubCommand::kUnknown};
    RelpackCommonArguments common;
    RelpackLogArguments log;
    RelpackBlobstoreArguments blobstore;
    RelpackCompileArguments compile;
    RelpackLocateArguments locate;
};

static inline void SetupRelpackCommonArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<RelpackCommonArguments*> const& clargs) {
    app->add_option_function<std::string>(
           "-C,--release-dir",
           [clargs](auto const& release_dir_raw) {
               clargs->release_dir = std::filesystem::weakly_canonical(
                   std::filesystem::absolute(release_dir_raw));
           },
           "Release source directory holding the builds trees and the "
           "configuration (Default: current directory).")
        ->type_name("PATH");
    app->add_option_function<std::string>(
           "--tmp-dir",
           [clargs](auto const& tmp_dir_raw) {
               clargs->tmp_dir = std::filesystem::weakly_canonical(
                   std::filesystem::absolute(tmp_dir_raw));
           },
           "Directory to create the staging directory in (Default: system "
           "temporary directory).")
        ->type_name("PATH");
}

static inline auto SetupRelpackLogArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<RelpackLogArguments*> const& clargs) {
    app->add_option_function<std::string>(
           "-f,--log-file",
           [clargs](auto const& log_file_) {
               clargs->log_files.emplace_back(log_file_);
           },
           "Path to local log file.")
        ->type_name("PATH")
        ->trigger_on_parse();  // run callback on all instances while parsing,
                               // not after all parsing is done
    app->add_option_function<int>(
           "--log-limit",
           [clargs](auto const& limit) {
               clargs->log_limit = ToLogLevel(limit);
           },
           fmt::format("Log limit (higher is more verbose) in interval [{},{}] "
                       "(Default: {}).",
                       static_cast<int>(kFirstLogLevel),
                       static_cast<int>(kLastLogLevel),
                       static_cast<int>(kDefaultLogLevel)))
        ->type_name("NUM");
    app->add_option_function<int>(
           "--restrict-stderr-log-limit",
           [clargs](auto const& limit) {
               clargs->restrict_stderr_log_limit = ToLogLevel(limit);
           },
           "Restrict logging on console to the minimum of the specified "
           "--log-limit and this value")
        ->type_name("NUM");
    app->add_flag("--plain-log",
                  clargs->plain_log,
                  "Do not use ANSI escape sequences to highlight messages.");
    app->add_flag(
        "--log-append",
        clargs->log_append,
        "Append messages to log file instead of overwriting existing.");
}

static inline void SetupRelpackBlobstoreArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<RelpackBlobstoreArguments*> const& clargs) {
    app->add_option_function<std::string>(
           "--blobstore-path",
           [clargs](auto const& path_raw) {
               clargs->blobstore_path = std::filesystem::weakly_canonical(
                   std::filesystem::absolute(path_raw));
           },
           "Use the local blobstore at this directory.")
        ->type_name("PATH");
    app->add_option("--blobstore-endpoint",
                    clargs->endpoint,
                    "Use the simple blobstore served at this URL.")
        ->type_name("URL");
    app->add_flag("--no-fetch-ssl-verify",
                  clargs->no_ssl_verify,
                  "Do not perform SSL verification when fetching blobs.");
    app->add_option_function<std::string>(
           "--fetch-cacert",
           [clargs](auto const& cacert_raw) {
               clargs->ca_bundle = std::filesystem::weakly_canonical(
                   std::filesystem::absolute(cacert_raw));
           },
           "CA certificate bundle to use for SSL verification when fetching "
           "blobs.")
        ->type_name("CA_BUNDLE");
}

static inline void SetupRelpackCompileArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<RelpackCompileArguments*> const& clargs) {
    app->add_option_function<std::string>(
           "manifest",
           [clargs](auto const& manifest_raw) {
               clargs->manifest = std::filesystem::path{manifest_raw};
           },
           "Release manifest, relative to the release directory.")
        ->required()
        ->type_name("MANIFEST");
    app->add_option_function<std::string>(
           "-o,--tarball",
           [clargs](auto const& tarball_raw) {
               clargs->tarball = std::filesystem::absolute(tarball_raw);
           },
           "Where to write the release tarball (Default: "
           "<name>-<version>.tgz next to the manifest).")
        ->type_name("PATH");
    app->add_option_function<std::string>(
           "--package-match",
           [clargs](auto const& sha) {
               clargs->package_matches.emplace_back(sha);
           },
           "Checksum or fingerprint of a package the destination already has. "
           "Can be specified multiple times.")
        ->type_name("SHA")
        ->trigger_on_parse();  // run callback on all instances while parsing,
                               // not after all parsing is done
    app->add_option_function<std::string>(
           "--package-matches",
           [clargs](auto const& file_raw) {
               clargs->package_matches_file =
                   std::filesystem::absolute(file_raw);
           },
           "JSON file with a list of checksums of packages the destination "
           "already has.")
        ->type_name("FILE");
}

static inline void SetupRelpackLocateArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<RelpackLocateArguments*> const& clargs) {
    app->add_option("--kind", clargs->kind, "Kind of artifact.")
        ->check(CLI::IsMember({"package", "job"}))
        ->type_name("KIND");
    app->add_option("name", clargs->name, "Name of the artifact.")
        ->required()
        ->type_name("NAME");
    app->add_option("sha1", clargs->sha1, "Checksum of the artifact.")
        ->required()
        ->type_name("SHA1");
    app->add_option(
           "--version", clargs->version, "Version, used in messages only.")
        ->type_name("VERSION");
}

#endif  // INCLUDED_SRC_RELPACK_MAIN_CLI_HPP

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

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "CLI/CLI.hpp"
#include "gsl/gsl"
#include "src/relpack/blobstore/blobstore_client.hpp"
#include "src/relpack/blobstore/blobstore_factory.hpp"
#include "src/relpack/logging/log_config.hpp"
#include "src/relpack/logging/log_level.hpp"
#include "src/relpack/logging/log_sink_cmdline.hpp"
#include "src/relpack/logging/log_sink_file.hpp"
#include "src/relpack/logging/logger.hpp"
#include "src/relpack/main/cli.hpp"
#include "src/relpack/main/exit_codes.hpp"
#include "src/relpack/main/release_config.hpp"
#include "src/relpack/main/version.hpp"
#include "src/relpack/release/artifact.hpp"
#include "src/relpack/release/artifact_locator.hpp"
#include "src/relpack/release/compile_error.hpp"
#include "src/relpack/release/release_compiler.hpp"
#include "src/utils/cpp/curl_context.hpp"

namespace {

/// \brief Setup arguments common to all subcommands.
void SetupCommonCommandArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommandLineArguments*> const& clargs) {
    SetupRelpackCommonArguments(app, &clargs->common);
    SetupRelpackLogArguments(app, &clargs->log);
    SetupRelpackBlobstoreArguments(app, &clargs->blobstore);
}

[[nodiscard]] auto ParseCommandLineArguments(int argc, char const* const* argv)
    -> CommandLineArguments {
    CLI::App app(
        "relpack, a tool to assemble release tarballs from a manifest");
    app.option_defaults()->take_last();
    auto* cmd_version = app.add_subcommand(
        "version", "Print version information in JSON format of this tool.");
    auto* cmd_compile = app.add_subcommand(
        "compile", "Assemble the release tarball described by a manifest.");
    auto* cmd_locate = app.add_subcommand(
        "locate",
        "Resolve a single package or job to a verified local tarball.");
    app.require_subcommand(1);

    CommandLineArguments clargs;
    SetupCommonCommandArguments(&app, &clargs);
    SetupRelpackCompileArguments(cmd_compile, &clargs.compile);
    SetupRelpackLocateArguments(cmd_locate, &clargs.locate);

    try {
        app.parse(argc, argv);
    } catch (CLI::Error& e) {
        [[maybe_unused]] auto err = app.exit(e);
        std::exit(kExitClargsError);
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error, "Command line parse error: {}", ex.what());
        std::exit(kExitClargsError);
    }

    if (*cmd_version) {
        clargs.cmd = SubCommand::kVersion;
    }
    else if (*cmd_compile) {
        clargs.cmd = SubCommand::kCompile;
    }
    else if (*cmd_locate) {
        clargs.cmd = SubCommand::kLocate;
    }
    return clargs;
}

void SetupDefaultLogging() {
    LogConfig::SetLogLimit(kDefaultLogLevel);
    LogConfig::SetSinks({LogSinkCmdLine::CreateFactory()});
}

void SetupLogging(RelpackLogArguments const& clargs) {
    if (clargs.log_limit) {
        LogConfig::SetLogLimit(*clargs.log_limit);
    }
    else {
        LogConfig::SetLogLimit(kDefaultLogLevel);
    }
    LogConfig::SetSinks({LogSinkCmdLine::CreateFactory(
        not clargs.plain_log, clargs.restrict_stderr_log_limit)});
    for (auto const& log_file : clargs.log_files) {
        LogConfig::AddSink(LogSinkFile::CreateFactory(
            log_file,
            clargs.log_append ? LogSinkFile::Mode::Append
                              : LogSinkFile::Mode::Overwrite));
    }
}

/// \brief Instantiate the configured blobstore; nullptr if none is configured.
[[nodiscard]] auto SetupBlobstore(std::filesystem::path const& release_dir,
                                  RelpackBlobstoreArguments const& clargs)
    -> std::optional<IBlobstoreClient::Ptr> {
    auto config = ReadBlobstoreConfig(release_dir, clargs);
    if (not config) {
        Logger::Log(LogLevel::Error,
                    "Invalid blobstore configuration:\n{}",
                    config.error());
        return std::nullopt;
    }
    if (not *config) {
        return IBlobstoreClient::Ptr{};
    }
    auto client = CreateBlobstoreClient(**config);
    if (client == nullptr) {
        Logger::Log(LogLevel::Error, "Failed to create blobstore client");
        return std::nullopt;
    }
    Logger::Log(LogLevel::Debug, "Using {}", client->Describe());
    return client;
}

[[nodiscard]] auto ExitCodeFor(CompileError const& error) -> int {
    return error.kind == CompileErrorKind::InvalidManifest ? kExitManifestError
                                                           : kExitCompileError;
}

[[nodiscard]] auto RunCompile(CommandLineArguments const& arguments,
                              std::filesystem::path const& release_dir,
                              IBlobstoreClient::Ptr const& blobstore) -> int {
    auto matches = arguments.compile.package_matches;
    if (arguments.compile.package_matches_file) {
        auto from_file =
            ReadPackageMatches(*arguments.compile.package_matches_file);
        if (not from_file) {
            Logger::Log(LogLevel::Error, "{}", from_file.error());
            return kExitConfigError;
        }
        matches.insert(matches.end(), from_file->begin(), from_file->end());
    }

    auto compiler = ReleaseCompiler::Create(arguments.compile.manifest,
                                            blobstore,
                                            matches,
                                            release_dir,
                                            arguments.common.tmp_dir);
    if (not compiler) {
        Logger::Log(LogLevel::Error, "{}", compiler.error().message);
        return ExitCodeFor(compiler.error());
    }
    if (arguments.compile.tarball) {
        compiler->SetTarballPath(*arguments.compile.tarball);
    }
    auto result = compiler->Compile();
    if (not result) {
        Logger::Log(LogLevel::Error, "{}", result.error().message);
        return ExitCodeFor(result.error());
    }
    Logger::Log(LogLevel::Info,
                "Release {} {}: {} packages and {} jobs copied, {} packages "
                "skipped",
                compiler->Manifest().Name(),
                compiler->Manifest().Version(),
                result->copied_packages.size(),
                result->copied_jobs.size(),
                result->skipped_packages.size());
    std::cout << result->tarball_path.string() << std::endl;
    return kExitSuccess;
}

[[nodiscard]] auto RunLocate(RelpackLocateArguments const& clargs,
                             std::filesystem::path const& release_dir,
                             IBlobstoreClient::Ptr const& blobstore) -> int {
    auto const kind =
        clargs.kind == "job" ? ArtifactKind::Job : ArtifactKind::Package;
    ArtifactLocator locator{release_dir, blobstore};
    auto path = locator.Locate(kind, clargs.name, clargs.version, clargs.sha1);
    if (not path) {
        Logger::Log(LogLevel::Error, "{}", path.error().message);
        return ExitCodeFor(path.error());
    }
    std::cout << path->string() << std::endl;
    return kExitSuccess;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
    SetupDefaultLogging();
    try {
        auto arguments = ParseCommandLineArguments(argc, argv);

        if (arguments.cmd == SubCommand::kVersion) {
            std::cout << version() << std::endl;
            return kExitSuccess;
        }

        SetupLogging(arguments.log);

        auto release_dir = arguments.common.release_dir.value_or(
            std::filesystem::current_path());

        // curl must be initialized globally before any handle is created
        CurlContext curl_context{};

        auto blobstore = SetupBlobstore(release_dir, arguments.blobstore);
        if (not blobstore) {
            return kExitConfigError;
        }

        if (arguments.cmd == SubCommand::kCompile) {
            return RunCompile(arguments, release_dir, *blobstore);
        }
        if (arguments.cmd == SubCommand::kLocate) {
            return RunLocate(arguments.locate, release_dir, *blobstore);
        }
        Logger::Log(LogLevel::Error, "Unknown subcommand");
    } catch (std::exception const& ex) {
        Logger::Log(
            LogLevel::Error, "Caught exception with message: {}", ex.what());
    }
    return kExitGenericFailure;
}

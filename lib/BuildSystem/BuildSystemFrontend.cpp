//===-- BuildSystemFrontend.cpp -------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "pipebuild/BuildSystem/BuildSystemFrontend.h"

#include "pipebuild/Basic/FileSystem.h"
#include "pipebuild/Basic/Logger.h"
#include "pipebuild/Basic/PlatformUtility.h"
#include "pipebuild/BuildSystem/Artifacts.h"
#include "pipebuild/BuildSystem/BuildSystemErrors.h"
#include "pipebuild/BuildSystem/Target.h"
#include "pipebuild/Core/FingerprintDB.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cstdlib>
#include <thread>

using namespace pipebuild;
using namespace pipebuild::buildsystem;

#pragma mark - BuildSystemInvocation implementation

void BuildSystemInvocation::getUsage(int optionWidth, raw_ostream& os) {
  const struct Options {
    llvm::StringRef option, helpText;
  } options[] = {
    { "--help", "show this help message and exit" },
    { "--version", "show the tool version" },
    { "--project-dir <PATH>", "use PATH as the project directory" },
    { "--build-dir <PATH>", "use PATH for intermediate files" },
    { "--cache-dir <PATH>", "use PATH for cached downloads" },
    { "--toolchain-root <PATH>", "use the toolchain installed at PATH" },
    { "--output-dir <PATH>", "write the build products to PATH" },
    { "--toolchain-version <VERSION>",
      "track the toolchain by VERSION instead of its artifacts" },
    { "-D<KEY>=<VALUE>", "define a build configuration value" },
    { "--no-db", "disable use of a build database" },
    { "--db <PATH>", "enable building against the database at PATH" },
    { "--serial", "do not build in parallel" },
    { "-j,--jobs <JOBS>", "set how many concurrent jobs (lanes) to run" },
    { "-v, --verbose", "show verbose status information" },
  };

  for (const auto& entry: options) {
    os << "  " << llvm::format("%-*s", optionWidth, entry.option.str().c_str())
       << " " << entry.helpText << "\n";
  }
}

void BuildSystemInvocation::parse(llvm::ArrayRef<std::string> args,
                                  llvm::SourceMgr& sourceMgr) {
  auto error = [&](const Twine &message) {
    sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Error, message);
    hadErrors = true;
  };

  auto parseLanes = [&](StringRef value, const std::string& option) {
    unsigned lanes;
    if (value.getAsInteger(10, lanes) || lanes == 0) {
      error("invalid argument '" + value + "' to '" + option + "'");
      return;
    }
    schedulerLanes = lanes;
  };

  auto parseDefine = [&](StringRef definition) {
    auto split = definition.split('=');
    if (split.first.empty() || definition.find('=') == StringRef::npos) {
      error("invalid definition '" + definition + "', expected <KEY>=<VALUE>");
      return;
    }
    defines.push_back({ split.first.str(), split.second.str() });
  };

  // The options which take a path-like string argument.
  const struct PathOption {
    const char* option;
    std::string BuildSystemInvocation::*value;
  } pathOptions[] = {
    { "--project-dir", &BuildSystemInvocation::projectDirectory },
    { "--build-dir", &BuildSystemInvocation::buildDirectory },
    { "--cache-dir", &BuildSystemInvocation::cacheDirectory },
    { "--toolchain-root", &BuildSystemInvocation::toolchainRootDirectory },
    { "--output-dir", &BuildSystemInvocation::outputDirectory },
    { "--db", &BuildSystemInvocation::dbPath },
  };

  while (!args.empty()) {
    const auto& option = args.front();
    args = args.slice(1);

    if (option == "-") {
      for (const auto& arg: args) {
        positionalArgs.push_back(arg);
      }
      break;
    }

    if (!option.empty() && option[0] != '-') {
      positionalArgs.push_back(option);
      continue;
    }

    const PathOption* pathOption = nullptr;
    for (const auto& entry: pathOptions) {
      if (option == entry.option)
        pathOption = &entry;
    }
    if (pathOption) {
      if (args.empty()) {
        error("missing argument to '" + option + "'");
        break;
      }
      this->*(pathOption->value) = args[0];
      if (option == "--db")
        useDB = true;
      args = args.slice(1);
      continue;
    }

    if (option == "--help") {
      showUsage = true;
      break;
    } else if (option == "--version") {
      showVersion = true;
      break;
    } else if (option == "--no-db") {
      useDB = false;
    } else if (option == "--toolchain-version") {
      if (args.empty()) {
        error("missing argument to '" + option + "'");
        break;
      }
      toolchainVersion = args[0];
      args = args.slice(1);
    } else if (option == "-D") {
      if (args.empty()) {
        error("missing argument to '" + option + "'");
        break;
      }
      parseDefine(args[0]);
      args = args.slice(1);
    } else if (StringRef(option).startswith("-D")) {
      parseDefine(StringRef(option).drop_front(2));
    } else if (option == "--serial") {
      useSerialBuild = true;
    } else if (option == "-j" || option == "--jobs") {
      if (args.empty()) {
        error("missing argument to '" + option + "'");
        break;
      }
      parseLanes(args[0], option);
      args = args.slice(1);
    } else if (StringRef(option).startswith("-j")) {
      parseLanes(StringRef(option).drop_front(2), "-j");
    } else if (option == "-v" || option == "--verbose") {
      showVerboseStatus = true;
    } else {
      error("invalid option '" + option + "'");
      break;
    }
  }
}

EnvironmentOptions BuildSystemInvocation::getEnvironmentOptions() const {
  auto under = [](StringRef base, StringRef name) {
    SmallString<256> path(base);
    llvm::sys::path::append(path, name);
    return path.str().str();
  };

  EnvironmentOptions options;
  options.projectDirectory = projectDirectory.empty() ? "." : projectDirectory;
  options.buildDirectory = buildDirectory.empty() ?
      under(options.projectDirectory, "build") : buildDirectory;
  options.cacheDirectory = cacheDirectory.empty() ?
      under(options.buildDirectory, "cache") : cacheDirectory;
  options.outputDirectory = outputDirectory.empty() ?
      under(options.buildDirectory, "out") : outputDirectory;
  options.toolchainRootDirectory = toolchainRootDirectory.empty() ?
      options.projectDirectory : toolchainRootDirectory;
  options.toolchainVersion = toolchainVersion;
  options.defines = defines;
  return options;
}

std::string BuildSystemInvocation::getDatabasePath() const {
  if (!dbPath.empty())
    return dbPath;
  SmallString<256> path(getEnvironmentOptions().buildDirectory);
  llvm::sys::path::append(path, "pipebuild.db");
  return path.str().str();
}

#pragma mark - BuildSystemFrontend implementation

namespace {

/// Reports target status to the diagnostics logger.
class FrontendDelegate : public BuildSystemDelegate {
  basic::Logger& logger;

public:
  explicit FrontendDelegate(basic::Logger& logger) : logger(logger) {}

  void targetStarted(const Target& target) override {
    logger.verbose(llvm::Twine("running '") + target.getName() + "'");
  }

  void targetSkipped(const Target& target) override {
    logger.verbose(llvm::Twine("'") + target.getName() + "' is up to date");
  }

  void targetFinished(const Target& target) override {
    logger.verbose(llvm::Twine("finished '") + target.getName() + "'");
  }

  void targetFailed(const Target& target, StringRef message) override {
    logger.error(llvm::toString(
        llvm::make_error<TargetFailedError>(target.getName(), message)));
  }
};

}

const uint32_t BuildSystemFrontend::ClientSchemaVersion = 1;

BuildSystemFrontend::BuildSystemFrontend(
    const BuildSystemInvocation& invocation, raw_ostream& os)
  : invocation(invocation), os(os) {}

BuildSystemFrontend::~BuildSystemFrontend() {}

bool BuildSystemFrontend::initialize() {
  fileSystem = basic::createLocalFileSystem();
  logger = basic::createStreamLogger(os, invocation.showVerboseStatus);

  // The lane count of asset copies is capped by the open file limit.
  if (basic::sys::raiseOpenFileLimit() != 0)
    logger->warning("failed to raise open file limit");

  auto options = invocation.getEnvironmentOptions();
  SmallString<256> artifactRoot(options.toolchainRootDirectory);
  if (std::error_code ec = llvm::sys::fs::make_absolute(artifactRoot)) {
    logger->error(llvm::Twine("unable to resolve toolchain root '") +
                  options.toolchainRootDirectory + "': " + ec.message());
    return false;
  }
  llvm::sys::path::remove_dots(artifactRoot, /*remove_dot_dot=*/true);
  llvm::sys::path::append(artifactRoot, "bin", "cache", "artifacts");
  artifactResolver = std::make_unique<DirectoryArtifactResolver>(artifactRoot);
  environment = std::make_unique<Environment>(options, *fileSystem, *logger,
                                              *artifactResolver);

  if (!fileSystem->createDirectories(environment->getBuildDirectory())) {
    logger->error(llvm::Twine("unable to create build directory '") +
                  environment->getBuildDirectory() + "'");
    return false;
  }

  if (!invocation.useDB) {
    db = core::createInMemoryFingerprintDB();
    return true;
  }

  std::string dbPath = invocation.getDatabasePath();
  std::string error;
  db = core::createSQLiteFingerprintDB(dbPath, ClientSchemaVersion, &error);
  if (!db) {
    logger->error(llvm::Twine("unable to open build database '") + dbPath +
                  "': " + error);
    return false;
  }
  return true;
}

bool BuildSystemFrontend::build(ArrayRef<std::string> targetNames) {
  std::vector<Target*> roots;
  if (targetNames.empty()) {
    roots.push_back(targets.lookup(BuiltinTargets::DefaultTargetName));
  }
  bool hadErrors = false;
  for (const auto& name: targetNames) {
    auto* target = targets.lookup(name);
    if (!target) {
      logger->error(llvm::Twine("unknown target '") + name + "'");
      hadErrors = true;
      continue;
    }
    roots.push_back(target);
  }
  if (hadErrors)
    return false;

  unsigned numLanes = 1;
  if (!invocation.useSerialBuild) {
    numLanes = invocation.schedulerLanes;
    if (numLanes == 0)
      numLanes = std::max(1u, std::thread::hardware_concurrency());
  }

  FrontendDelegate delegate(*logger);
  BuildSystem buildSystem(delegate, *db, numLanes);
  auto result = buildSystem.build(roots, *environment);

  // Configuration errors were already reported by the build system.
  if (!result.success)
    return false;

  os << result.executedTargets.size() << " targets built, "
     << result.skippedTargets.size() << " up to date\n";
  return true;
}

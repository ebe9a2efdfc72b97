//===- BuildSystemFrontend.h ------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_BUILDSYSTEM_BUILDSYSTEMFRONTEND_H
#define PIPEBUILD_BUILDSYSTEM_BUILDSYSTEMFRONTEND_H

#include "pipebuild/Basic/Compiler.h"
#include "pipebuild/Basic/LLVM.h"
#include "pipebuild/BuildSystem/BuildSystem.h"
#include "pipebuild/BuildSystem/BuiltinTargets.h"
#include "pipebuild/BuildSystem/Environment.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace llvm {

class SourceMgr;

}

namespace pipebuild {
namespace basic {

class FileSystem;
class Logger;

}

namespace core {

class FingerprintDB;

}

namespace buildsystem {

class ArtifactResolver;

/// Description of the invocation of the build system.
class BuildSystemInvocation {
public:
  /// Whether the command usage should be printed.
  bool showUsage = false;

  /// Whether the command version should be printed.
  bool showVersion = false;

  /// Whether to show verbose output.
  bool showVerboseStatus = false;

  /// Whether to use a serial build.
  bool useSerialBuild = false;

  /// Whether to record fingerprints in a database that persists between
  /// builds.
  bool useDB = true;

  /// The path of the database file to use, or empty for the default
  /// "<build-dir>/pipebuild.db".
  std::string dbPath;

  /// The number of lanes to use, or zero to use one per CPU.
  unsigned schedulerLanes = 0;

  /// The project directory, or empty for the current directory.
  std::string projectDirectory;

  /// The other directory roots, or empty for their defaults beneath the
  /// project directory.
  std::string buildDirectory;
  std::string cacheDirectory;
  std::string toolchainRootDirectory;
  std::string outputDirectory;

  /// The pinned toolchain version, if any.
  llvm::Optional<std::string> toolchainVersion;

  /// The "-D<key>=<value>" definitions, in order.
  std::vector<std::pair<std::string, std::string>> defines;

  /// The positional arguments.
  std::vector<std::string> positionalArgs;

  /// Whether there were any parsing errors.
  bool hadErrors = false;

public:
  /// Get the appropriate "usage" text to use for the built in arguments.
  static void getUsage(int optionWidth, raw_ostream& os);

  /// Parse the invocation parameters from the given arguments.
  ///
  /// \param sourceMgr The source manager to use for diagnostics.
  void parse(ArrayRef<std::string> args, llvm::SourceMgr& sourceMgr);

  /// Get the environment configuration, with defaults applied.
  EnvironmentOptions getEnvironmentOptions() const;

  /// Get the path of the fingerprint database, with defaults applied.
  std::string getDatabasePath() const;
};

/// This provides a standard "frontend" to the build system features.
///
/// The frontend glues together the parts a command line build needs: the
/// local file system, diagnostics, the artifact layout of the toolchain, the
/// fingerprint database and the registry of built-in targets.
///
/// NOTE: This class is *NOT* thread safe.
class BuildSystemFrontend {
  const BuildSystemInvocation& invocation;
  raw_ostream& os;

  std::unique_ptr<basic::FileSystem> fileSystem;
  std::unique_ptr<basic::Logger> logger;
  std::unique_ptr<ArtifactResolver> artifactResolver;
  std::unique_ptr<Environment> environment;
  std::unique_ptr<core::FingerprintDB> db;
  BuiltinTargets targets;

  BuildSystemFrontend(const BuildSystemFrontend&) PIPEBUILD_DELETED_FUNCTION;
  void operator=(const BuildSystemFrontend&) PIPEBUILD_DELETED_FUNCTION;

public:
  /// The version of the fingerprint records this client writes.
  static const uint32_t ClientSchemaVersion;

  /// \param os The stream for diagnostics and the build summary.
  BuildSystemFrontend(const BuildSystemInvocation& invocation,
                      raw_ostream& os);
  ~BuildSystemFrontend();

  const BuildSystemInvocation& getInvocation() const { return invocation; }
  const BuiltinTargets& getTargets() const { return targets; }

  /// Initialize the build environment and open the fingerprint database.
  ///
  /// \returns True on success, or false if there were errors.
  bool initialize();

  /// Get the environment; only valid after a successful \see initialize().
  const Environment& getEnvironment() const { return *environment; }

  /// Build the named targets, or the default target if none is named.
  ///
  /// \returns True on success, or false if there were errors.
  bool build(ArrayRef<std::string> targetNames);
};

}
}

#endif

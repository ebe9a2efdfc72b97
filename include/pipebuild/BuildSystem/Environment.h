//===- Environment.h --------------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_BUILDSYSTEM_ENVIRONMENT_H
#define PIPEBUILD_BUILDSYSTEM_ENVIRONMENT_H

#include "pipebuild/Basic/Compiler.h"
#include "pipebuild/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <string>
#include <utility>
#include <vector>

namespace pipebuild {
namespace basic {
  class FileSystem;
  class Logger;
}

namespace buildsystem {

class ArtifactResolver;

/// The symbolic roots a pattern source may start with.
enum class RootToken {
  ProjectDirectory,
  BuildDirectory,
  CacheDirectory,
  ToolchainRoot,
  OutputDirectory,
};

/// Get the spelling of a root token, e.g. "{PROJECT_DIR}".
StringRef getRootTokenSpelling(RootToken token);

/// Parse the spelling of a root token.
llvm::Optional<RootToken> parseRootToken(StringRef spelling);

/// The configurable values of an \see Environment.
struct EnvironmentOptions {
  std::string projectDirectory;
  std::string buildDirectory;
  std::string cacheDirectory;
  std::string toolchainRootDirectory;
  std::string outputDirectory;

  /// The pinned toolchain version, if any.
  llvm::Optional<std::string> toolchainVersion;

  /// Build configuration values, in the order they were defined.
  std::vector<std::pair<std::string, std::string>> defines;
};

/// The context a build runs in: the directory roots plus the capabilities
/// (file system, logging, artifact lookup) that build actions use.
///
/// An environment is constructed once per build invocation and is immutable
/// thereafter. The capabilities are not owned and must outlive it.
class Environment {
  std::string projectDirectory;
  std::string buildDirectory;
  std::string cacheDirectory;
  std::string toolchainRootDirectory;
  std::string outputDirectory;
  llvm::Optional<std::string> toolchainVersion;
  std::vector<std::pair<std::string, std::string>> defines;

  basic::FileSystem& fileSystem;
  basic::Logger& logger;
  const ArtifactResolver& artifacts;

public:
  /// Create an environment.
  ///
  /// Relative directories are made absolute against the current working
  /// directory. Symbolic links are resolved only when paths are resolved, so
  /// the directories need not exist yet.
  Environment(const EnvironmentOptions& options,
              basic::FileSystem& fileSystem, basic::Logger& logger,
              const ArtifactResolver& artifacts);

  /// @name Accessors
  /// @{

  const std::string& getProjectDirectory() const { return projectDirectory; }
  const std::string& getBuildDirectory() const { return buildDirectory; }
  const std::string& getCacheDirectory() const { return cacheDirectory; }
  const std::string& getToolchainRootDirectory() const {
    return toolchainRootDirectory;
  }
  const std::string& getOutputDirectory() const { return outputDirectory; }

  const std::string& getRootDirectory(RootToken token) const;

  const llvm::Optional<std::string>& getToolchainVersion() const {
    return toolchainVersion;
  }

  const std::vector<std::pair<std::string, std::string>>& getDefines() const {
    return defines;
  }

  /// Get the value of a define, if present.
  llvm::Optional<StringRef> getDefine(StringRef key) const;

  basic::FileSystem& getFileSystem() const { return fileSystem; }
  basic::Logger& getLogger() const { return logger; }
  const ArtifactResolver& getArtifactResolver() const { return artifacts; }

  /// @}

  /// Get the file which stands in for the whole toolchain when the toolchain
  /// version is pinned.
  std::string getToolchainVersionMarkerPath() const;
};

}
}

#endif

//===-- Environment.cpp ---------------------------------------------------===//
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

#include "pipebuild/BuildSystem/Environment.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

using namespace pipebuild;
using namespace pipebuild::buildsystem;

StringRef buildsystem::getRootTokenSpelling(RootToken token) {
  switch (token) {
  case RootToken::ProjectDirectory: return "{PROJECT_DIR}";
  case RootToken::BuildDirectory: return "{BUILD_DIR}";
  case RootToken::CacheDirectory: return "{CACHE_DIR}";
  case RootToken::ToolchainRoot: return "{TOOLCHAIN_ROOT}";
  case RootToken::OutputDirectory: return "{OUTPUT_DIR}";
  }
  llvm_unreachable("invalid root token");
}

llvm::Optional<RootToken> buildsystem::parseRootToken(StringRef spelling) {
  return llvm::StringSwitch<llvm::Optional<RootToken>>(spelling)
    .Case("{PROJECT_DIR}", RootToken::ProjectDirectory)
    .Case("{BUILD_DIR}", RootToken::BuildDirectory)
    .Case("{CACHE_DIR}", RootToken::CacheDirectory)
    .Case("{TOOLCHAIN_ROOT}", RootToken::ToolchainRoot)
    .Case("{OUTPUT_DIR}", RootToken::OutputDirectory)
    .Default(llvm::None);
}

static std::string makeAbsolutePath(StringRef path) {
  SmallString<256> result(path);
  // An empty path stays empty, so that unset roots are easy to diagnose.
  if (result.empty())
    return std::string();
  // Failing to get the working directory leaves the path relative.
  (void)llvm::sys::fs::make_absolute(result);
  llvm::sys::path::remove_dots(result, /*remove_dot_dot:*/ true);
  return result.str().str();
}

Environment::Environment(const EnvironmentOptions& options,
                         basic::FileSystem& fileSystem, basic::Logger& logger,
                         const ArtifactResolver& artifacts)
  : projectDirectory(makeAbsolutePath(options.projectDirectory)),
    buildDirectory(makeAbsolutePath(options.buildDirectory)),
    cacheDirectory(makeAbsolutePath(options.cacheDirectory)),
    toolchainRootDirectory(makeAbsolutePath(options.toolchainRootDirectory)),
    outputDirectory(makeAbsolutePath(options.outputDirectory)),
    toolchainVersion(options.toolchainVersion),
    defines(options.defines),
    fileSystem(fileSystem), logger(logger), artifacts(artifacts) {}

const std::string& Environment::getRootDirectory(RootToken token) const {
  switch (token) {
  case RootToken::ProjectDirectory: return projectDirectory;
  case RootToken::BuildDirectory: return buildDirectory;
  case RootToken::CacheDirectory: return cacheDirectory;
  case RootToken::ToolchainRoot: return toolchainRootDirectory;
  case RootToken::OutputDirectory: return outputDirectory;
  }
  llvm_unreachable("invalid root token");
}

llvm::Optional<StringRef> Environment::getDefine(StringRef key) const {
  // Later definitions override earlier ones.
  for (auto it = defines.rbegin(), ie = defines.rend(); it != ie; ++it) {
    if (it->first == key)
      return StringRef(it->second);
  }
  return llvm::None;
}

std::string Environment::getToolchainVersionMarkerPath() const {
  SmallString<256> path(toolchainRootDirectory);
  llvm::sys::path::append(path, "bin", "internal", "toolchain.version");
  return path.str().str();
}

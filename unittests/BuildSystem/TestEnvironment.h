//===- unittests/BuildSystem/TestEnvironment.h ------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#ifndef PIPEBUILD_UNITTESTS_TESTENVIRONMENT_H
#define PIPEBUILD_UNITTESTS_TESTENVIRONMENT_H

#include "MockBuildSystemDelegate.h"
#include "TempDir.h"

#include "pipebuild/Basic/FileSystem.h"
#include "pipebuild/BuildSystem/Artifacts.h"
#include "pipebuild/BuildSystem/Environment.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pipebuild {
namespace unittests {

/// A build environment rooted in a fresh temporary directory.
///
/// The project, build, cache, toolchain and output directories are the
/// "project", "build", "cache", "toolchain" and "out" subdirectories; artifacts
/// live under "artifacts".
class TestEnvironment {
public:
  TmpDir tempDir;
  std::unique_ptr<basic::FileSystem> fileSystem;
  MockLogger logger;
  buildsystem::DirectoryArtifactResolver artifacts;
  std::unique_ptr<buildsystem::Environment> environment;

  explicit TestEnvironment(
      llvm::Optional<std::string> toolchainVersion = llvm::None,
      std::vector<std::pair<std::string, std::string>> defines = {})
    : tempDir("pipebuild-test"),
      fileSystem(basic::createLocalFileSystem()),
      artifacts(tempDir.path("artifacts"))
  {
    buildsystem::EnvironmentOptions options;
    options.projectDirectory = tempDir.path("project");
    options.buildDirectory = tempDir.path("build");
    options.cacheDirectory = tempDir.path("cache");
    options.toolchainRootDirectory = tempDir.path("toolchain");
    options.outputDirectory = tempDir.path("out");
    options.toolchainVersion = std::move(toolchainVersion);
    options.defines = std::move(defines);
    for (const auto* directory: { &options.projectDirectory,
                                  &options.buildDirectory,
                                  &options.cacheDirectory,
                                  &options.toolchainRootDirectory,
                                  &options.outputDirectory }) {
      fileSystem->createDirectories(*directory);
    }
    environment.reset(new buildsystem::Environment(options, *fileSystem,
                                                   logger, artifacts));
  }

  const buildsystem::Environment& getEnvironment() const {
    return *environment;
  }

  std::string path(llvm::StringRef relativePath) const {
    return tempDir.path(relativePath);
  }

  std::string writeFile(llvm::StringRef relativePath,
                        llvm::StringRef contents) const {
    return tempDir.writeFile(relativePath, contents);
  }
};

}
}

#endif

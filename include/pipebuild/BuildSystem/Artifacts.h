//===- Artifacts.h ----------------------------------------------*- C++ -*-===//
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
//
// Identifiers for toolchain artifacts and the resolver which maps them onto
// paths in the artifact cache.
//
//===----------------------------------------------------------------------===//

#ifndef PIPEBUILD_BUILDSYSTEM_ARTIFACTS_H
#define PIPEBUILD_BUILDSYSTEM_ARTIFACTS_H

#include "pipebuild/Basic/Compiler.h"
#include "pipebuild/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <string>

namespace pipebuild {
namespace buildsystem {

/// A target-specific toolchain artifact.
enum class Artifact {
  /// The ahead-of-time snapshot compiler.
  Snapshotter,

  /// The runtime shared library linked into applications.
  RuntimeLibrary,

  /// The public headers of the runtime library.
  RuntimeHeaders,

  /// The client wrapper sources shipped with the runtime.
  ClientWrapper,
};

/// A host toolchain artifact, independent of the target platform.
enum class HostArtifact {
  /// The root of the host SDK.
  SdkRoot,

  /// The platform kernel used by the compiler front end.
  PlatformKernel,

  /// The icon font bundled with every application.
  IconFont,

  /// The offline shader compiler.
  ShaderCompiler,

  /// The desktop runtime directory unpacked by desktop builds.
  DesktopRuntime,
};

enum class TargetPlatform {
  LinuxX64,
  LinuxArm64,
  DarwinX64,
  WindowsX64,
  AndroidArm64,
};

enum class BuildMode {
  Debug,
  Profile,
  Release,
};

StringRef getArtifactName(Artifact artifact);
StringRef getHostArtifactName(HostArtifact artifact);
StringRef getTargetPlatformName(TargetPlatform platform);
StringRef getBuildModeName(BuildMode mode);

llvm::Optional<Artifact> parseArtifact(StringRef name);
llvm::Optional<HostArtifact> parseHostArtifact(StringRef name);
llvm::Optional<TargetPlatform> parseTargetPlatform(StringRef name);
llvm::Optional<BuildMode> parseBuildMode(StringRef name);

/// Abstract interface for locating toolchain artifacts.
class ArtifactResolver {
  // DO NOT COPY
  ArtifactResolver(const ArtifactResolver&) PIPEBUILD_DELETED_FUNCTION;
  void operator=(const ArtifactResolver&) PIPEBUILD_DELETED_FUNCTION;

public:
  ArtifactResolver() {}
  virtual ~ArtifactResolver();

  /// Get the path of a target artifact, which may be a file or a directory.
  virtual std::string
  getArtifactPath(Artifact artifact,
                  llvm::Optional<TargetPlatform> platform = llvm::None,
                  llvm::Optional<BuildMode> mode = llvm::None) const = 0;

  /// Get the path of a host artifact, which may be a file or a directory.
  virtual std::string getHostArtifactPath(HostArtifact artifact) const = 0;
};

/// An artifact resolver over a cache laid out as:
///
///   <root>/<platform>[-<mode>]/<artifact>
///   <root>/host/<host artifact>
///
/// Target artifacts without a platform live in "<root>/common".
class DirectoryArtifactResolver : public ArtifactResolver {
  std::string root;

public:
  explicit DirectoryArtifactResolver(StringRef root) : root(root.str()) {}

  const std::string& getRoot() const { return root; }

  std::string
  getArtifactPath(Artifact artifact,
                  llvm::Optional<TargetPlatform> platform = llvm::None,
                  llvm::Optional<BuildMode> mode = llvm::None) const override;

  std::string getHostArtifactPath(HostArtifact artifact) const override;
};

}
}

#endif

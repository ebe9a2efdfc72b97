//===- Source.h -------------------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_BUILDSYSTEM_SOURCE_H
#define PIPEBUILD_BUILDSYSTEM_SOURCE_H

#include "pipebuild/Basic/LLVM.h"
#include "pipebuild/BuildSystem/Artifacts.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cassert>
#include <string>

namespace pipebuild {
namespace buildsystem {

class Environment;

/// Check the syntax of a path template.
///
/// \see Source::validate().
llvm::Error validatePattern(StringRef pattern);

/// A declarative description of one or more files consumed or produced by a
/// target.
class Source {
public:
  enum class Kind {
    /// A path template starting with a root token, e.g.
    /// "{PROJECT_DIR}/assets/*.png".
    Pattern,

    /// A target toolchain artifact.
    Artifact,

    /// A host toolchain artifact.
    HostArtifact,
  };

private:
  Kind kind;

  /// The template, for pattern sources.
  std::string pattern;

  /// Whether a missing file is acceptable, for pattern sources.
  bool optional = false;

  buildsystem::Artifact artifact = buildsystem::Artifact::Snapshotter;
  llvm::Optional<TargetPlatform> platform;
  llvm::Optional<BuildMode> mode;

  buildsystem::HostArtifact hostArtifact = buildsystem::HostArtifact::SdkRoot;

  explicit Source(Kind kind) : kind(kind) {}

public:
  /// @name Construction Functions
  /// @{

  static Source makePattern(StringRef pattern, bool optional = false) {
    Source result(Kind::Pattern);
    result.pattern = pattern.str();
    result.optional = optional;
    return result;
  }

  static Source makeArtifact(buildsystem::Artifact artifact,
                             llvm::Optional<TargetPlatform> platform = llvm::None,
                             llvm::Optional<BuildMode> mode = llvm::None) {
    Source result(Kind::Artifact);
    result.artifact = artifact;
    result.platform = platform;
    result.mode = mode;
    return result;
  }

  static Source makeHostArtifact(buildsystem::HostArtifact artifact) {
    Source result(Kind::HostArtifact);
    result.hostArtifact = artifact;
    return result;
  }

  /// @}

  /// @name Accessors
  /// @{

  Kind getKind() const { return kind; }

  bool isPattern() const { return kind == Kind::Pattern; }
  bool isArtifact() const { return kind == Kind::Artifact; }
  bool isHostArtifact() const { return kind == Kind::HostArtifact; }

  StringRef getPattern() const {
    assert(isPattern());
    return pattern;
  }

  bool isOptional() const { return isPattern() && optional; }

  buildsystem::Artifact getArtifact() const {
    assert(isArtifact());
    return artifact;
  }
  llvm::Optional<TargetPlatform> getPlatform() const { return platform; }
  llvm::Optional<BuildMode> getMode() const { return mode; }

  buildsystem::HostArtifact getHostArtifact() const {
    assert(isHostArtifact());
    return hostArtifact;
  }

  /// @}

  /// Whether this is a pattern containing a wildcard.
  bool hasWildcard() const {
    return isPattern() && StringRef(pattern).contains('*');
  }

  /// Whether the set of files this source stands for can only be known by
  /// consulting the file system.
  ///
  /// This is true for wildcard patterns, and for artifacts which resolve to a
  /// directory in \arg environment.
  bool isImplicit(const Environment& environment) const;

  /// Check the syntax of a pattern source; other kinds are always valid.
  ///
  /// \returns An InvalidPatternError if the template does not start with a
  /// root token, or its wildcard is repeated or not in the final segment.
  llvm::Error validate() const;

  /// Get a stable textual description, used in diagnostics and declaration
  /// signatures.
  std::string toString() const;
};

}
}

#endif

//===- SourceVisitor.h ------------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_BUILDSYSTEM_SOURCEVISITOR_H
#define PIPEBUILD_BUILDSYSTEM_SOURCEVISITOR_H

#include "pipebuild/Basic/LLVM.h"
#include "pipebuild/BuildSystem/Artifacts.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace pipebuild {
namespace buildsystem {

class Environment;
class Source;

/// The concrete files a list of sources stands for.
struct ResolvedFiles {
  /// The resolved absolute paths, deduplicated, in declaration order.
  std::vector<std::string> sources;

  /// Whether a requested depfile did not exist yet.
  ///
  /// If so, the set of sources is incomplete until the target has run once.
  bool containsNewDepfile = false;
};

/// Resolves sources against an environment.
///
/// The visitor holds no mutable state; every operation returns its result as a
/// value, so one visitor can be shared across threads.
class SourceVisitor {
  const Environment& environment;

  /// Whether inputs (as opposed to outputs) are being resolved.
  bool inputs;

public:
  explicit SourceVisitor(const Environment& environment, bool inputs = true)
    : environment(environment), inputs(inputs) {}

  const Environment& getEnvironment() const { return environment; }
  bool isResolvingInputs() const { return inputs; }

  /// Resolve a list of sources followed by a list of depfiles (named relative
  /// to the build directory).
  ///
  /// \returns The combined result, or the first fatal error (an
  /// InvalidPatternError, or a MissingInputError when resolving inputs).
  llvm::Expected<ResolvedFiles> resolve(ArrayRef<Source> sources,
                                        ArrayRef<std::string> depfiles = {}) const;

  /// Resolve a single source.
  llvm::Expected<ResolvedFiles> visit(const Source& source) const;

  /// Resolve a path template.
  ///
  /// The first segment must be a root token; a '*' may only appear once, in
  /// the final segment. The directory holding a wildcard is created if it
  /// does not exist, and its regular files are matched against the literal
  /// fragments around the '*'. A non-wildcard template yields exactly one
  /// path, or nothing if it is \arg optional and missing.
  llvm::Expected<ResolvedFiles> visitPattern(StringRef pattern,
                                             bool optional) const;

  /// Resolve a target artifact.
  ResolvedFiles visitArtifact(Artifact artifact,
                              llvm::Optional<TargetPlatform> platform,
                              llvm::Optional<BuildMode> mode) const;

  /// Resolve a host artifact.
  ResolvedFiles visitHostArtifact(HostArtifact artifact) const;

  /// Resolve the inputs (or outputs) recorded in a depfile under the build
  /// directory.
  ///
  /// A missing depfile sets \see ResolvedFiles::containsNewDepfile; a
  /// malformed one is reported to the logger and contributes nothing.
  ResolvedFiles visitDepfile(StringRef name) const;

private:
  ResolvedFiles visitArtifactPath(const std::string& path) const;
};

}
}

#endif

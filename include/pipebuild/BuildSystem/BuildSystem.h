//===- BuildSystem.h --------------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_BUILDSYSTEM_BUILDSYSTEM_H
#define PIPEBUILD_BUILDSYSTEM_BUILDSYSTEM_H

#include "pipebuild/Basic/Compiler.h"
#include "pipebuild/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace pipebuild {
namespace core {
  class FingerprintDB;
}

namespace buildsystem {

class Environment;
class Target;

/// Delegate interface for build status reporting.
///
/// The callbacks may be invoked from any execution lane, but never
/// concurrently with each other.
class BuildSystemDelegate {
  // DO NOT COPY
  BuildSystemDelegate(const BuildSystemDelegate&)
    PIPEBUILD_DELETED_FUNCTION;
  void operator=(const BuildSystemDelegate&)
    PIPEBUILD_DELETED_FUNCTION;
  BuildSystemDelegate &operator=(BuildSystemDelegate&& rhs)
    PIPEBUILD_DELETED_FUNCTION;

public:
  BuildSystemDelegate() {}
  virtual ~BuildSystemDelegate();

  /// Called when a target's action is about to run.
  virtual void targetStarted(const Target& target) = 0;

  /// Called when a target was found to be up to date.
  virtual void targetSkipped(const Target& target) = 0;

  /// Called when a target's action completed and its outputs were recorded.
  virtual void targetFinished(const Target& target) = 0;

  /// Called when a target failed, with the failure message.
  virtual void targetFailed(const Target& target, StringRef message) = 0;
};

/// A delegate which ignores all status reports.
class NullBuildSystemDelegate : public BuildSystemDelegate {
public:
  void targetStarted(const Target&) override {}
  void targetSkipped(const Target&) override {}
  void targetFinished(const Target&) override {}
  void targetFailed(const Target&, StringRef) override {}
};

/// The outcome of a build.
struct BuildResult {
  struct TargetFailure {
    /// The failing target, or empty for a failure of the build as a whole.
    std::string target;
    std::string message;
  };

  bool success = false;

  /// Whether the build was cancelled before every target was considered.
  bool cancelled = false;

  /// The targets whose action ran, in completion order.
  std::vector<std::string> executedTargets;

  /// The targets which were up to date.
  std::vector<std::string> skippedTargets;

  /// The failures, the first cause first.
  std::vector<TargetFailure> failures;
};

/// Executes target graphs, re-running only the targets whose inputs, outputs
/// or declarations changed since their last recorded build.
class BuildSystem {
private:
  void *impl;

  // Copying is disabled.
  BuildSystem(const BuildSystem&) PIPEBUILD_DELETED_FUNCTION;
  void operator=(const BuildSystem&) PIPEBUILD_DELETED_FUNCTION;

public:
  /// Create a build system.
  ///
  /// \param numLanes The number of targets which may run concurrently. With
  /// a single lane, targets run in order on the calling thread.
  BuildSystem(BuildSystemDelegate& delegate, core::FingerprintDB& db,
              unsigned numLanes = 1);
  ~BuildSystem();

  BuildSystemDelegate& getDelegate();

  /// Build the graph rooted at \arg root.
  BuildResult build(Target& root, const Environment& environment);

  /// Build the graphs rooted at each of \arg roots.
  BuildResult build(ArrayRef<Target*> roots, const Environment& environment);

  /// Cancel the current build.
  ///
  /// No further targets are started; targets already running complete.
  void cancel();
};

}
}

#endif

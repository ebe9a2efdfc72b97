//===- TargetGraph.h --------------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_BUILDSYSTEM_TARGETGRAPH_H
#define PIPEBUILD_BUILDSYSTEM_TARGETGRAPH_H

#include "pipebuild/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/Support/Error.h"

#include <vector>

namespace pipebuild {
namespace buildsystem {

class Target;

/// A validated view of the targets reachable from a set of roots.
class TargetGraph {
  /// The reachable targets, each after all of its dependencies.
  std::vector<Target*> order;

  /// The targets which depend on each target.
  llvm::DenseMap<Target*, std::vector<Target*>> dependents;

  TargetGraph() {}

public:
  /// Validate the graph reachable from \arg roots.
  ///
  /// \returns The graph, or a DuplicateTargetError if two distinct targets
  /// share a name, or a CycleError naming every target along a cycle.
  static llvm::Expected<TargetGraph> create(ArrayRef<Target*> roots);

  /// Get the targets in dependency-first order.
  ArrayRef<Target*> getTargets() const { return order; }

  /// Get the targets which directly depend on \arg target.
  ArrayRef<Target*> getDependents(Target* target) const;
};

}
}

#endif

//===-- TargetGraph.cpp ---------------------------------------------------===//
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

#include "pipebuild/BuildSystem/TargetGraph.h"

#include "pipebuild/BuildSystem/BuildSystemErrors.h"
#include "pipebuild/BuildSystem/Target.h"

#include "llvm/ADT/DenseSet.h"
#include "llvm/ADT/StringMap.h"

#include <algorithm>

using namespace pipebuild;
using namespace pipebuild::buildsystem;

namespace {

/// Depth-first traversal which records targets in post order and reports the
/// first cycle found.
struct GraphWalker {
  std::vector<Target*> order;
  llvm::DenseSet<Target*> visited;
  llvm::StringMap<Target*> targetsByName;

  /// The targets on the current traversal path.
  std::vector<Target*> stack;
  llvm::DenseSet<Target*> onStack;

  llvm::Error visit(Target* target) {
    if (onStack.count(target)) {
      // Report the cycle from the first occurrence of the target on the path.
      auto it = std::find(stack.begin(), stack.end(), target);
      std::vector<std::string> cycle;
      for (; it != stack.end(); ++it)
        cycle.push_back((*it)->getName());
      cycle.push_back(target->getName());
      return llvm::make_error<CycleError>(std::move(cycle));
    }
    if (visited.count(target))
      return llvm::Error::success();

    auto inserted = targetsByName.insert(
        std::make_pair(target->getName(), target));
    if (!inserted.second && inserted.first->second != target)
      return llvm::make_error<DuplicateTargetError>(target->getName());

    stack.push_back(target);
    onStack.insert(target);
    for (auto* dependency: target->getDependencies()) {
      if (auto error = visit(dependency))
        return error;
    }
    onStack.erase(target);
    stack.pop_back();

    visited.insert(target);
    order.push_back(target);
    return llvm::Error::success();
  }
};

}

llvm::Expected<TargetGraph> TargetGraph::create(ArrayRef<Target*> roots) {
  GraphWalker walker;
  for (auto* root: roots) {
    if (auto error = walker.visit(root))
      return std::move(error);
  }

  TargetGraph graph;
  graph.order = std::move(walker.order);
  for (auto* target: graph.order) {
    graph.dependents[target];
    for (auto* dependency: target->getDependencies()) {
      auto& list = graph.dependents[dependency];
      if (std::find(list.begin(), list.end(), target) == list.end())
        list.push_back(target);
    }
  }
  return std::move(graph);
}

ArrayRef<Target*> TargetGraph::getDependents(Target* target) const {
  auto it = dependents.find(target);
  if (it == dependents.end())
    return {};
  return it->second;
}

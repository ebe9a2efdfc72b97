//===- unittests/BuildSystem/TargetGraphTest.cpp --------------------------===//
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

#include "pipebuild/BuildSystem/TargetGraph.h"

#include "pipebuild/BuildSystem/BuildSystemErrors.h"
#include "pipebuild/BuildSystem/Target.h"

#include "llvm/Support/Error.h"

#include "gtest/gtest.h"

#include <memory>

using namespace pipebuild;
using namespace pipebuild::buildsystem;

namespace {

std::unique_ptr<Target> makeTarget(StringRef name,
                                   std::vector<Target*> dependencies = {}) {
  return std::unique_ptr<Target>(new CustomTarget(
      name, std::move(dependencies), {}, {}, {}, nullptr));
}

std::vector<std::string> getNames(ArrayRef<Target*> targets) {
  std::vector<std::string> names;
  for (auto* target: targets)
    names.push_back(target->getName());
  return names;
}

/// Get the cycle reported by creating a graph from \arg roots.
std::vector<std::string> getCycle(ArrayRef<Target*> roots) {
  auto graph = TargetGraph::create(roots);
  if (graph) {
    ADD_FAILURE() << "expected a cycle";
    return {};
  }
  std::vector<std::string> cycle;
  llvm::handleAllErrors(graph.takeError(), [&](const CycleError& error) {
                          cycle = error.getCycle();
                        });
  return cycle;
}

TEST(TargetGraphTest, dependencyOrder) {
  auto a = makeTarget("a");
  auto b = makeTarget("b", { a.get() });
  auto c = makeTarget("c", { a.get() });
  auto d = makeTarget("d", { b.get(), c.get() });

  auto graph = TargetGraph::create({ d.get() });
  ASSERT_TRUE(bool(graph)) << llvm::toString(graph.takeError());
  EXPECT_EQ(std::vector<std::string>({ "a", "b", "c", "d" }),
            getNames(graph->getTargets()));
  EXPECT_EQ(std::vector<std::string>({ "b", "c" }),
            getNames(graph->getDependents(a.get())));
  EXPECT_EQ(std::vector<std::string>({ "d" }),
            getNames(graph->getDependents(b.get())));
  EXPECT_TRUE(graph->getDependents(d.get()).empty());
}

TEST(TargetGraphTest, sharedRootsAreVisitedOnce) {
  auto a = makeTarget("a");
  auto b = makeTarget("b", { a.get(), a.get() });

  auto graph = TargetGraph::create({ b.get(), a.get(), b.get() });
  ASSERT_TRUE(bool(graph)) << llvm::toString(graph.takeError());
  EXPECT_EQ(std::vector<std::string>({ "a", "b" }),
            getNames(graph->getTargets()));
  EXPECT_EQ(std::vector<std::string>({ "b" }),
            getNames(graph->getDependents(a.get())));
}

TEST(TargetGraphTest, selfCycle) {
  auto a = makeTarget("a");
  a->addDependency(a.get());
  EXPECT_EQ(std::vector<std::string>({ "a", "a" }), getCycle({ a.get() }));
}

TEST(TargetGraphTest, cycleIsReportedFromEveryEntryPoint) {
  auto a = makeTarget("a");
  auto b = makeTarget("b", { a.get() });
  auto c = makeTarget("c", { b.get() });
  a->addDependency(c.get());

  EXPECT_EQ(std::vector<std::string>({ "a", "c", "b", "a" }),
            getCycle({ a.get() }));
  EXPECT_EQ(std::vector<std::string>({ "b", "a", "c", "b" }),
            getCycle({ b.get() }));
  EXPECT_EQ(std::vector<std::string>({ "c", "b", "a", "c" }),
            getCycle({ c.get() }));

  // Targets leading into the cycle are not part of it.
  auto d = makeTarget("d", { b.get() });
  EXPECT_EQ(std::vector<std::string>({ "b", "a", "c", "b" }),
            getCycle({ d.get() }));
}

TEST(TargetGraphTest, duplicateNames) {
  auto first = makeTarget("same");
  auto second = makeTarget("same");
  auto root = makeTarget("root", { first.get(), second.get() });

  auto graph = TargetGraph::create({ root.get() });
  ASSERT_FALSE(bool(graph));
  std::string name;
  llvm::handleAllErrors(graph.takeError(),
                        [&](const DuplicateTargetError& error) {
                          name = error.getName();
                        });
  EXPECT_EQ("same", name);
}

}

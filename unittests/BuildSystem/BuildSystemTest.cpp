//===- unittests/BuildSystem/BuildSystemTest.cpp --------------------------===//
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

#include "pipebuild/BuildSystem/BuildSystem.h"

#include "MockBuildSystemDelegate.h"
#include "TestEnvironment.h"

#include "pipebuild/Basic/FileSystem.h"
#include "pipebuild/BuildSystem/Environment.h"
#include "pipebuild/BuildSystem/Source.h"
#include "pipebuild/BuildSystem/Target.h"
#include "pipebuild/Core/Depfile.h"
#include "pipebuild/Core/FingerprintDB.h"

#include "llvm/Support/Errc.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/MemoryBuffer.h"

#include "gtest/gtest.h"

#include <algorithm>
#include <atomic>
#include <memory>

using namespace pipebuild;
using namespace pipebuild::buildsystem;
using namespace pipebuild::unittests;

namespace {

typedef std::vector<std::string> NameList;

NameList sorted(NameList names) {
  std::sort(names.begin(), names.end());
  return names;
}

/// A target which copies one file to another, counting its runs.
class CopyTarget : public Target {
  std::string from;
  std::string to;

public:
  std::atomic<int> runCount{0};
  std::atomic<bool> shouldFail{false};

  CopyTarget(StringRef name, std::vector<Target*> dependencies,
             const std::string& from, const std::string& to,
             StringRef inputPattern, StringRef outputPattern)
    : Target(name, std::move(dependencies),
             { Source::makePattern(inputPattern) },
             { Source::makePattern(outputPattern) }),
      from(from), to(to) {}

  llvm::Error build(const Environment& environment) override {
    ++runCount;
    if (shouldFail)
      return llvm::createStringError(llvm::errc::io_error, "injected failure");
    auto& fileSystem = environment.getFileSystem();
    auto contents = fileSystem.getFileContents(from);
    if (!contents) {
      return llvm::createStringError(llvm::errc::no_such_file_or_directory,
                                     "unable to read '%s'", from.c_str());
    }
    if (!fileSystem.copyFile(from, to)) {
      return llvm::createStringError(llvm::errc::io_error,
                                     "unable to write '%s'", to.c_str());
    }
    return llvm::Error::success();
  }
};

/// The graph used by most tests:
///
///   root -> pkg -> gen    (project/a.txt -> build/a.out -> out/pkg.out)
///        -> other         (project/b.txt -> build/b.out)
class BuildSystemTest : public ::testing::Test {
protected:
  TestEnvironment env;
  std::unique_ptr<core::FingerprintDB> db{ core::createInMemoryFingerprintDB() };
  MockBuildSystemDelegate delegate;

  std::unique_ptr<CopyTarget> gen;
  std::unique_ptr<CopyTarget> pkg;
  std::unique_ptr<CopyTarget> other;
  std::unique_ptr<Target> root;

  void SetUp() override {
    env.writeFile("project/a.txt", "a");
    env.writeFile("project/b.txt", "b");

    gen.reset(new CopyTarget("gen", {}, env.path("project/a.txt"),
                             env.path("build/a.out"),
                             "{PROJECT_DIR}/a.txt", "{BUILD_DIR}/a.out"));
    pkg.reset(new CopyTarget("pkg", { gen.get() }, env.path("build/a.out"),
                             env.path("out/pkg.out"),
                             "{BUILD_DIR}/a.out", "{OUTPUT_DIR}/pkg.out"));
    other.reset(new CopyTarget("other", {}, env.path("project/b.txt"),
                               env.path("build/b.out"),
                               "{PROJECT_DIR}/b.txt", "{BUILD_DIR}/b.out"));
    root.reset(new CustomTarget("root", { pkg.get(), other.get() }, {}, {}, {},
                                nullptr));
  }

  BuildResult build(unsigned numLanes = 1) {
    BuildSystem system(delegate, *db, numLanes);
    return system.build(*root, env.getEnvironment());
  }
};

TEST_F(BuildSystemTest, secondBuildSkipsEverything) {
  auto result = build();
  ASSERT_TRUE(result.success);
  EXPECT_EQ(NameList({ "gen", "pkg", "other", "root" }),
            result.executedTargets);
  EXPECT_TRUE(result.skippedTargets.empty());
  EXPECT_EQ("a", env.fileSystem->getFileContents(
                env.path("out/pkg.out"))->getBuffer().str());

  delegate.clear();
  result = build();
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.executedTargets.empty());
  EXPECT_EQ(NameList({ "gen", "pkg", "other", "root" }),
            result.skippedTargets);
  EXPECT_EQ(NameList({ "skipped: gen", "skipped: pkg", "skipped: other",
                       "skipped: root" }),
            delegate.getMessages());
  EXPECT_EQ(1, gen->runCount.load());
  EXPECT_EQ(1, other->runCount.load());
}

TEST_F(BuildSystemTest, changedInputRebuildsDependents) {
  ASSERT_TRUE(build().success);

  env.writeFile("project/a.txt", "changed");
  auto result = build();
  ASSERT_TRUE(result.success);
  EXPECT_EQ(NameList({ "gen", "pkg", "root" }), result.executedTargets);
  EXPECT_EQ(NameList({ "other" }), result.skippedTargets);
  EXPECT_EQ("changed", env.fileSystem->getFileContents(
                env.path("out/pkg.out"))->getBuffer().str());
  EXPECT_EQ(1, other->runCount.load());

  auto verbose = env.logger.getMessages("verbose");
  EXPECT_NE(verbose.end(),
            std::find(verbose.begin(), verbose.end(),
                      "building 'gen' (changed file '" +
                      env.path("project/a.txt") + "')"));
  EXPECT_NE(verbose.end(),
            std::find(verbose.begin(), verbose.end(),
                      "building 'pkg' (a dependency was rebuilt)"));
}

TEST_F(BuildSystemTest, changedOrMissingOutputRebuilds) {
  ASSERT_TRUE(build().success);

  env.fileSystem->remove(env.path("build/b.out"));
  auto result = build();
  ASSERT_TRUE(result.success);
  EXPECT_EQ(NameList({ "other", "root" }), result.executedTargets);
  EXPECT_TRUE(env.fileSystem->exists(env.path("build/b.out")));

  env.writeFile("out/pkg.out", "tampered");
  result = build();
  ASSERT_TRUE(result.success);
  EXPECT_EQ(NameList({ "pkg", "root" }), result.executedTargets);
  EXPECT_EQ("a", env.fileSystem->getFileContents(
                env.path("out/pkg.out"))->getBuffer().str());
}

TEST_F(BuildSystemTest, failureBlocksDependents) {
  ASSERT_TRUE(build().success);

  gen->shouldFail = true;
  env.writeFile("project/a.txt", "aa");
  delegate.clear();
  auto result = build();
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.cancelled);
  ASSERT_EQ(1u, result.failures.size());
  EXPECT_EQ("gen", result.failures[0].target);
  EXPECT_EQ("injected failure", result.failures[0].message);
  EXPECT_EQ(NameList({ "other" }), result.skippedTargets);
  EXPECT_TRUE(result.executedTargets.empty());
  EXPECT_EQ(1, pkg->runCount.load());
  EXPECT_EQ(NameList({ "started: gen", "failed: gen: injected failure",
                       "skipped: other" }),
            delegate.getMessages());

  // The failed target has no record, so it runs again once fixed.
  core::TargetFingerprint record;
  std::string error;
  EXPECT_FALSE(db->lookupFingerprint("gen", &record, &error));
  EXPECT_TRUE(error.empty());

  gen->shouldFail = false;
  result = build();
  ASSERT_TRUE(result.success);
  EXPECT_EQ(NameList({ "gen", "pkg", "root" }), result.executedTargets);
  EXPECT_EQ(2, pkg->runCount.load());
}

TEST_F(BuildSystemTest, missingInputFailsTarget) {
  env.fileSystem->remove(env.path("project/b.txt"));
  auto result = build();
  EXPECT_FALSE(result.success);
  ASSERT_EQ(1u, result.failures.size());
  EXPECT_EQ("other", result.failures[0].target);
  EXPECT_EQ(0, other->runCount.load());
  EXPECT_EQ(NameList({ "gen", "pkg" }), result.executedTargets);
}

TEST_F(BuildSystemTest, undeclaredOutputFails) {
  CustomTarget lazy("lazy", {}, {}, { Source::makePattern("{BUILD_DIR}/x") },
                    {}, nullptr);
  BuildSystem system(delegate, *db);
  auto result = system.build(lazy, env.getEnvironment());
  EXPECT_FALSE(result.success);
  ASSERT_EQ(1u, result.failures.size());
  EXPECT_EQ("declared output '" + env.path("build/x") + "' was not produced",
            result.failures[0].message);
  EXPECT_EQ(NameList({ "started: lazy", "failed: lazy: " +
                       result.failures[0].message }),
            delegate.getMessages());
}

TEST_F(BuildSystemTest, depfileDiscoveredInputs) {
  auto input = env.writeFile("project/discovered.txt", "1");
  std::atomic<int> runCount{0};
  CustomTarget discover(
      "discover", {}, {}, {}, { "discover.d" },
      [&](const Environment& environment) -> llvm::Error {
        ++runCount;
        core::Depfile depfile({ input }, { env.path("build/discovered.out") });
        if (!environment.getFileSystem().writeFileContents(
                env.path("build/discovered.out"), "out")) {
          return llvm::createStringError(llvm::errc::io_error, "write failed");
        }
        return depfile.writeToFile(environment.getFileSystem(),
                                   env.path("build/discover.d"));
      });

  BuildSystem system(delegate, *db);
  ASSERT_TRUE(system.build(discover, env.getEnvironment()).success);
  ASSERT_TRUE(system.build(discover, env.getEnvironment()).success);
  EXPECT_EQ(1, runCount.load());

  // The input named only by the depfile is tracked.
  env.writeFile("project/discovered.txt", "22");
  ASSERT_TRUE(system.build(discover, env.getEnvironment()).success);
  EXPECT_EQ(2, runCount.load());

  // As is the output.
  env.fileSystem->remove(env.path("build/discovered.out"));
  ASSERT_TRUE(system.build(discover, env.getEnvironment()).success);
  EXPECT_EQ(3, runCount.load());
}

TEST_F(BuildSystemTest, signatureChangeRebuilds) {
  ASSERT_TRUE(build().success);

  // Same name, different declaration.
  CustomTarget changed("other", {},
                       { Source::makePattern("{PROJECT_DIR}/b.txt"),
                         Source::makePattern("{PROJECT_DIR}/a.txt") },
                       {}, {}, nullptr);
  BuildSystem system(delegate, *db);
  auto result = system.build(changed, env.getEnvironment());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(NameList({ "other" }), result.executedTargets);

  auto verbose = env.logger.getMessages("verbose");
  EXPECT_NE(verbose.end(),
            std::find(verbose.begin(), verbose.end(),
                      "building 'other' (declaration changed)"));
}

TEST_F(BuildSystemTest, parallelBuild) {
  auto result = build(/*numLanes=*/4);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(NameList({ "gen", "other", "pkg", "root" }),
            sorted(result.executedTargets));
  // Dependencies always complete first.
  auto& executed = result.executedTargets;
  auto position = [&](StringRef name) {
    return std::find(executed.begin(), executed.end(), name) -
      executed.begin();
  };
  EXPECT_LT(position("gen"), position("pkg"));
  EXPECT_LT(position("pkg"), position("root"));
  EXPECT_LT(position("other"), position("root"));

  env.writeFile("project/b.txt", "bb");
  result = build(/*numLanes=*/4);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(NameList({ "other", "root" }), result.executedTargets);
  EXPECT_EQ(NameList({ "gen", "pkg" }), sorted(result.skippedTargets));
}

TEST_F(BuildSystemTest, parallelFailureBlocksDependents) {
  env.fileSystem->remove(env.path("project/a.txt"));
  auto result = build(/*numLanes=*/4);
  EXPECT_FALSE(result.success);
  ASSERT_EQ(1u, result.failures.size());
  EXPECT_EQ("gen", result.failures[0].target);
  EXPECT_EQ(NameList({ "other" }), result.executedTargets);
  EXPECT_EQ(0, pkg->runCount.load());
}

TEST_F(BuildSystemTest, cancellation) {
  std::unique_ptr<BuildSystem> system(new BuildSystem(delegate, *db));
  CustomTarget first("first", {}, {}, {}, {},
                     [&](const Environment&) {
                       system->cancel();
                       return llvm::Error::success();
                     });
  CustomTarget second("second", { &first }, {}, {}, {}, nullptr);

  auto result = system->build(second, env.getEnvironment());
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(NameList({ "first" }), result.executedTargets);

  // A later build starts afresh.
  result = system->build(second, env.getEnvironment());
  EXPECT_TRUE(result.success);
  EXPECT_EQ(NameList({ "second" }), result.executedTargets);
  EXPECT_EQ(NameList({ "first" }), result.skippedTargets);
}

TEST_F(BuildSystemTest, cycleFailsBeforeRunning) {
  gen->addDependency(root.get());
  auto result = build();
  EXPECT_FALSE(result.success);
  ASSERT_EQ(1u, result.failures.size());
  EXPECT_EQ("", result.failures[0].target);
  EXPECT_EQ(0, gen->runCount.load());
  EXPECT_EQ(1u, env.logger.getMessages("error").size());
}

TEST_F(BuildSystemTest, invalidPatternFailsBeforeRunning) {
  CopyTarget bad("bad", {}, env.path("project/b.txt"), env.path("build/x"),
                 "{PROJECT_DIR}/b.txt", "{BOGUS}/x");
  root->addDependency(&bad);

  for (unsigned numLanes: { 1u, 4u }) {
    auto result = build(numLanes);
    EXPECT_FALSE(result.success);
    ASSERT_EQ(1u, result.failures.size());
    EXPECT_EQ("", result.failures[0].target);
    EXPECT_NE(std::string::npos,
              result.failures[0].message.find("invalid pattern '{BOGUS}/x'"))
      << result.failures[0].message;
    EXPECT_TRUE(result.executedTargets.empty());
    EXPECT_TRUE(result.skippedTargets.empty());
    EXPECT_EQ(0, bad.runCount.load());
    EXPECT_EQ(0, gen->runCount.load());
    EXPECT_EQ(0, other->runCount.load());
  }
}

TEST_F(BuildSystemTest, inputEditedDuringActionRebuilds) {
  std::string input = env.path("project/a.txt");
  std::string output = env.path("build/edited.out");
  int runs = 0;
  CustomTarget target("edited", {},
                      { Source::makePattern("{PROJECT_DIR}/a.txt") },
                      { Source::makePattern("{BUILD_DIR}/edited.out") }, {},
                      [&](const Environment& environment) {
                        auto& fileSystem = environment.getFileSystem();
                        EXPECT_TRUE(fileSystem.copyFile(input, output));
                        // The input changes after the action read it.
                        if (++runs == 1)
                          EXPECT_TRUE(fileSystem.writeFileContents(input,
                                                                   "edited"));
                        return llvm::Error::success();
                      });

  BuildSystem system(delegate, *db);
  auto result = system.build(target, env.getEnvironment());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(NameList({ "edited" }), result.executedTargets);

  result = system.build(target, env.getEnvironment());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(NameList({ "edited" }), result.executedTargets);
  EXPECT_EQ(2, runs);

  result = system.build(target, env.getEnvironment());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(NameList({ "edited" }), result.skippedTargets);
}

}

//===- unittests/BuildSystem/CopyAssetsTest.cpp ---------------------------===//
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

#include "pipebuild/BuildSystem/CopyAssets.h"

#include "MockBuildSystemDelegate.h"
#include "TestEnvironment.h"

#include "pipebuild/Basic/FileSystem.h"
#include "pipebuild/BuildSystem/BuildSystem.h"
#include "pipebuild/BuildSystem/BuildSystemErrors.h"
#include "pipebuild/Core/FingerprintDB.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/MemoryBuffer.h"

#include "gtest/gtest.h"

using namespace pipebuild;
using namespace pipebuild::buildsystem;
using namespace pipebuild::unittests;

namespace {

std::string readFile(TestEnvironment& env, StringRef relativePath) {
  auto buffer = env.fileSystem->getFileContents(env.path(relativePath));
  if (!buffer)
    return "<missing>";
  return buffer->getBuffer().str();
}

TEST(CopyAssetsTest, parseManifest) {
  auto entries = parseAssetManifest(
      R"([
        { "path": "a.txt", "source": "assets/a.txt" },
        { "path": "fonts/b.otf", "source": "/abs/b.otf" },
        { "path": "NOTICES", "contents": "inline text" }
      ])", "/project/asset_manifest.json", "/project");
  ASSERT_TRUE(bool(entries)) << llvm::toString(entries.takeError());
  ASSERT_EQ(3u, entries->size());

  EXPECT_EQ("a.txt", (*entries)[0].path);
  EXPECT_EQ(std::string("/project/assets/a.txt"), *(*entries)[0].sourcePath);
  EXPECT_EQ(std::string("/abs/b.otf"), *(*entries)[1].sourcePath);
  EXPECT_FALSE((*entries)[2].sourcePath.hasValue());
  EXPECT_EQ("inline text", (*entries)[2].contents);
}

TEST(CopyAssetsTest, parseManifestErrors) {
  struct {
    const char* json;
    const char* message;
  } cases[] = {
    { "[", "m.json: invalid asset manifest: " },
    { "{}", "m.json: asset manifest must be an array" },
    { "[{ \"source\": \"x\" }]", "m.json: asset manifest entry 0 has no 'path'" },
    { "[1]", "m.json: asset manifest entry 0 has no 'path'" },
    { "[{ \"path\": \"x\" }]",
      "m.json: asset manifest entry 'x' has neither 'source' nor 'contents'" },
  };

  for (const auto& test: cases) {
    auto entries = parseAssetManifest(test.json, "m.json", "/project");
    ASSERT_FALSE(bool(entries)) << test.json;
    std::string message = llvm::toString(entries.takeError());
    EXPECT_EQ(0u, StringRef(message).find(test.message))
      << test.json << ": " << message;
  }
}

TEST(CopyAssetsTest, copiesEntries) {
  TestEnvironment env;
  auto source = env.writeFile("project/assets/logo.png", "png");

  std::vector<AssetEntry> entries(2);
  entries[0].path = "images/logo.png";
  entries[0].sourcePath = source;
  entries[1].path = "NOTICES";
  entries[1].contents = "notices";

  auto depfile = copyAssets(env.getEnvironment(), entries, env.path("out"));
  ASSERT_TRUE(bool(depfile)) << llvm::toString(depfile.takeError());
  EXPECT_EQ(std::vector<std::string>({ source }), depfile->getInputs());
  EXPECT_EQ(std::vector<std::string>({ env.path("out/images/logo.png"),
                                       env.path("out/NOTICES") }),
            depfile->getOutputs());
  EXPECT_EQ("png", readFile(env, "out/images/logo.png"));
  EXPECT_EQ("notices", readFile(env, "out/NOTICES"));
}

TEST(CopyAssetsTest, reportsEveryFailure) {
  TestEnvironment env;

  std::vector<AssetEntry> entries;
  for (unsigned i = 0; i != 100; ++i) {
    AssetEntry entry;
    entry.path = "asset" + std::to_string(i);
    std::string relativePath = "project/assets/" + entry.path;
    // Entries 10, 50 and 90 have no source file.
    if (i % 40 == 10)
      entry.sourcePath = env.path(relativePath);
    else
      entry.sourcePath = env.writeFile(relativePath, entry.path);
    entries.push_back(std::move(entry));
  }

  auto depfile = copyAssets(env.getEnvironment(), entries, env.path("out"),
                            /*numLanes=*/8);
  ASSERT_FALSE(bool(depfile));

  std::vector<std::string> failedPaths;
  llvm::handleAllErrors(depfile.takeError(), [&](const AssetCopyError& error) {
      for (const auto& failure: error.getFailures()) {
        failedPaths.push_back(failure.path);
        EXPECT_EQ(0u, StringRef(failure.message).find("missing source file"));
      }
    });
  EXPECT_EQ(std::vector<std::string>({ "asset10", "asset50", "asset90" }),
            failedPaths);
  EXPECT_EQ(3u, env.logger.getMessages("error").size());

  // The copies which could succeed did.
  EXPECT_EQ("asset0", readFile(env, "out/asset0"));
  EXPECT_EQ("asset99", readFile(env, "out/asset99"));
  EXPECT_FALSE(env.fileSystem->exists(env.path("out/asset50")));
}

TEST(CopyAssetsTest, rejectsPathsOutsideOutputDirectory) {
  TestEnvironment env;
  auto source = env.writeFile("project/assets/a.txt", "a");

  std::vector<AssetEntry> entries(5);
  entries[0].path = "ok.txt";
  entries[0].sourcePath = source;
  entries[1].path = "../../x";
  entries[1].contents = "escaped";
  entries[2].path = "nested/../../sibling";
  entries[2].contents = "escaped";
  entries[3].path = "nested/..";
  entries[3].contents = "escaped";
  entries[4].path = "nested/../inside.txt";
  entries[4].contents = "inside";

  auto depfile = copyAssets(env.getEnvironment(), entries, env.path("out"),
                            /*numLanes=*/4);
  ASSERT_FALSE(bool(depfile));

  std::vector<std::string> failedPaths;
  llvm::handleAllErrors(depfile.takeError(), [&](const AssetCopyError& error) {
      for (const auto& failure: error.getFailures()) {
        failedPaths.push_back(failure.path);
        EXPECT_EQ(0u, StringRef(failure.message).find(
                          "path is outside the output directory"));
      }
    });
  EXPECT_EQ(std::vector<std::string>({ "../../x", "nested/../../sibling",
                                       "nested/.." }),
            failedPaths);
  EXPECT_EQ(3u, env.logger.getMessages("error").size());

  // Nothing is copied, not even the valid entries.
  EXPECT_FALSE(env.fileSystem->exists(env.path("out/ok.txt")));
  EXPECT_FALSE(env.fileSystem->exists(env.path("out/inside.txt")));
  EXPECT_FALSE(env.fileSystem->exists(env.path("sibling")));

  // Without the escaping entries the copy succeeds.
  entries.erase(entries.begin() + 1, entries.begin() + 4);
  depfile = copyAssets(env.getEnvironment(), entries, env.path("out"));
  ASSERT_TRUE(bool(depfile)) << llvm::toString(depfile.takeError());
  EXPECT_EQ("a", readFile(env, "out/ok.txt"));
  EXPECT_EQ("inside", readFile(env, "out/inside.txt"));
}

TEST(CopyAssetsTest, incrementalTarget) {
  TestEnvironment env;
  env.writeFile("project/assets/a.txt", "a");
  env.writeFile("project/asset_manifest.json",
                R"([{ "path": "a.txt", "source": "assets/a.txt" }])");

  auto db = core::createInMemoryFingerprintDB();
  MockBuildSystemDelegate delegate;
  BuildSystem system(delegate, *db);
  CopyAssetsTarget target({}, /*numLanes=*/4);
  EXPECT_EQ("copy_assets", target.getName());

  auto result = system.build(target, env.getEnvironment());
  ASSERT_TRUE(result.success) << result.failures[0].message;
  EXPECT_EQ("a", readFile(env, "out/a.txt"));
  EXPECT_TRUE(env.fileSystem->exists(env.path("build/assets.d")));

  result = system.build(target, env.getEnvironment());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(std::vector<std::string>({ "copy_assets" }),
            result.skippedTargets);

  // The asset is only named by the manifest, and is tracked through the
  // depfile.
  env.writeFile("project/assets/a.txt", "changed");
  result = system.build(target, env.getEnvironment());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(std::vector<std::string>({ "copy_assets" }),
            result.executedTargets);
  EXPECT_EQ("changed", readFile(env, "out/a.txt"));

  // A missing manifest fails the target.
  env.fileSystem->remove(env.path("project/asset_manifest.json"));
  result = system.build(target, env.getEnvironment());
  EXPECT_FALSE(result.success);
  ASSERT_EQ(1u, result.failures.size());
  EXPECT_EQ("copy_assets", result.failures[0].target);
}

}

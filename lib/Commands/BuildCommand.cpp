//===-- BuildCommand.cpp --------------------------------------------------===//
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

#include "pipebuild/Commands/Commands.h"

#include "pipebuild/Basic/Version.h"
#include "pipebuild/BuildSystem/BuildSystemFrontend.h"
#include "pipebuild/BuildSystem/Target.h"
#include "pipebuild/Core/FingerprintDB.h"

#include "llvm/ADT/StringSet.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdio>
#include <cstdlib>

using namespace pipebuild;
using namespace pipebuild::buildsystem;
using namespace pipebuild::commands;

#pragma mark - Build Command

static void buildUsage(int exitCode) {
  int optionWidth = 32;
  fprintf(stderr, "Usage: %s build [options] [<target>...]\n",
          getProgramName());
  fprintf(stderr, "\nOptions:\n");
  BuildSystemInvocation::getUsage(optionWidth, llvm::errs());
  ::exit(exitCode);
}

int commands::executeBuildCommand(const std::vector<std::string> &args) {
  // The source manager to use for diagnostics.
  llvm::SourceMgr sourceMgr;

  // Create the invocation.
  BuildSystemInvocation invocation{};
  invocation.parse(args, sourceMgr);

  // Handle invocation actions.
  if (invocation.showUsage) {
    buildUsage(0);
  } else if (invocation.showVersion) {
    printf("%s\n", getPipeBuildFullVersion().c_str());
    return 0;
  } else if (invocation.hadErrors) {
    buildUsage(1);
  }

  BuildSystemFrontend frontend(invocation, llvm::errs());
  if (!frontend.initialize())
    return 1;
  if (!frontend.build(invocation.positionalArgs))
    return 1;

  return 0;
}

#pragma mark - Targets Command

static void targetsUsage(int exitCode) {
  int optionWidth = 32;
  fprintf(stderr, "Usage: %s targets [options]\n", getProgramName());
  fprintf(stderr, "\nLists the available targets; those with a recorded "
          "build are marked.\n");
  fprintf(stderr, "\nOptions:\n");
  BuildSystemInvocation::getUsage(optionWidth, llvm::errs());
  ::exit(exitCode);
}

int commands::executeTargetsCommand(const std::vector<std::string> &args) {
  llvm::SourceMgr sourceMgr;
  BuildSystemInvocation invocation{};
  invocation.parse(args, sourceMgr);

  if (invocation.showUsage) {
    targetsUsage(0);
  } else if (invocation.hadErrors || !invocation.positionalArgs.empty()) {
    targetsUsage(1);
  }

  // Only consult an existing database; listing never creates one.
  llvm::StringSet<> recorded;
  std::string dbPath = invocation.getDatabasePath();
  if (invocation.useDB && llvm::sys::fs::exists(dbPath)) {
    std::string error;
    auto db = core::createSQLiteFingerprintDB(
        dbPath, BuildSystemFrontend::ClientSchemaVersion, &error);
    std::vector<std::string> names;
    if (!db || !db->getTargetNames(names, &error)) {
      fprintf(stderr, "error: %s: unable to read build database '%s': %s\n",
              getProgramName(), dbPath.c_str(), error.c_str());
      return 1;
    }
    for (const auto& name: names)
      recorded.insert(name);
  }

  BuiltinTargets targets;
  for (const auto& target: targets.getTargets()) {
    llvm::outs() << (recorded.count(target->getName()) ? "* " : "  ")
                 << target->getName();
    bool first = true;
    for (const auto* dependency: target->getDependencies()) {
      llvm::outs() << (first ? ": " : " ") << dependency->getName();
      first = false;
    }
    llvm::outs() << "\n";
  }
  return 0;
}

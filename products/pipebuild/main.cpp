//===-- main.cpp - pipebuild Frontend Utility -----------------------------===//
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

#include "pipebuild/Basic/Version.h"

#include "pipebuild/Commands/Commands.h"

#include "llvm/Support/Path.h"
#include "llvm/Support/Signals.h"

#include <cstdio>
#include <cstdlib>

using namespace pipebuild;
using namespace pipebuild::commands;

static void usage(int exitCode) {
  fprintf(stderr, "Usage: %s [--version] [--help] <command> [<args>]\n",
          getProgramName());
  fprintf(stderr, "\n");
  fprintf(stderr, "Available commands:\n");
  fprintf(stderr, "  build       -- Build targets incrementally\n");
  fprintf(stderr, "  targets     -- List the available targets\n");
  fprintf(stderr, "  depfile     -- Print the contents of a depfile\n");
  fprintf(stderr, "\n");
  exit(exitCode);
}

int main(int argc, const char **argv) {
  // Print stacks on error.
  llvm::sys::PrintStackTraceOnErrorSignal(argv[0]);

  setProgramName(llvm::sys::path::filename(argv[0]));

  // Expect the first argument to be the name of a subtool to delegate to.
  if (argc == 1 || std::string(argv[1]) == "--help")
    usage(0);

  if (std::string(argv[1]) == "--version") {
    // Print the version and exit.
    printf("%s\n", getPipeBuildFullVersion().c_str());
    return 0;
  }

  // Otherwise, expect a command name.
  std::string command(argv[1]);
  std::vector<std::string> args;
  for (int i = 2; i != argc; ++i) {
    args.push_back(argv[i]);
  }

  if (command == "build") {
    return executeBuildCommand(args);
  } else if (command == "targets") {
    return executeTargetsCommand(args);
  } else if (command == "depfile") {
    return executeDepfileCommand(args);
  } else {
    fprintf(stderr, "error: %s: unknown command '%s'\n", getProgramName(),
            command.c_str());
    usage(1);
    return 1;
  }
}

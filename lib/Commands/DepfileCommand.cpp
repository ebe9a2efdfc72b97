//===-- DepfileCommand.cpp ------------------------------------------------===//
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

#include "pipebuild/Basic/FileSystem.h"
#include "pipebuild/Core/Depfile.h"

#include "llvm/Support/raw_ostream.h"

#include <cstdio>
#include <cstdlib>

using namespace pipebuild;
using namespace pipebuild::commands;

static void depfileUsage(int exitCode) {
  fprintf(stderr, "Usage: %s depfile [--help] <path>\n", getProgramName());
  fprintf(stderr, "\nPrints the outputs and inputs recorded in a depfile.\n");
  ::exit(exitCode);
}

int commands::executeDepfileCommand(const std::vector<std::string> &args) {
  if (args.empty() || args[0] == "--help")
    depfileUsage(args.empty() ? 1 : 0);
  if (args.size() != 1) {
    fprintf(stderr, "error: %s: invalid number of arguments\n",
            getProgramName());
    depfileUsage(1);
  }

  auto fileSystem = basic::createLocalFileSystem();
  auto depfile = core::Depfile::readFromFile(*fileSystem, args[0]);
  if (!depfile) {
    fprintf(stderr, "error: %s: %s\n", getProgramName(),
            llvm::toString(depfile.takeError()).c_str());
    return 1;
  }

  llvm::outs() << "outputs:\n";
  for (const auto& output: depfile->getOutputs())
    llvm::outs() << "  " << output << "\n";
  llvm::outs() << "inputs:\n";
  for (const auto& input: depfile->getInputs())
    llvm::outs() << "  " << input << "\n";
  return 0;
}

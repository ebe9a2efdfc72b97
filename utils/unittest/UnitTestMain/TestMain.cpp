//===--- utils/unittest/UnitTestMain/TestMain.cpp -------------------------===//
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

#include "pipebuild/Basic/PlatformUtility.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Signals.h"

#include "gtest/gtest.h"

#include <cstdio>

int main(int argc, char **argv) {
  llvm::sys::PrintStackTraceOnErrorSignal(argv[0]);
  testing::InitGoogleTest(&argc, argv);

  // The concurrency tests open many files at once.
  if (pipebuild::basic::sys::raiseOpenFileLimit() != 0)
    fprintf(stderr, "warning: unable to raise open file limit\n");

  return RUN_ALL_TESTS();
}

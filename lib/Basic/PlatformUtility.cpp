//===- PlatformUtility.cpp - Platform Specific Utilities ------------------===//
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
#include "pipebuild/Basic/Stat.h"

#include <algorithm>
#include <cstring>

using namespace pipebuild;
using namespace pipebuild::basic;

int sys::lstat(const char *fileName, sys::StatStruct *buf) {
  return ::lstat(fileName, buf);
}

int sys::stat(const char *fileName, sys::StatStruct *buf) {
  return ::stat(fileName, buf);
}

bool sys::mkdir(const char* fileName) {
  return ::mkdir(fileName, S_IRWXU | S_IRWXG | S_IRWXO) == 0;
}

int sys::rmdir(const char *path) {
  return ::rmdir(path);
}

int sys::unlink(const char *fileName) {
  return ::unlink(fileName);
}

std::string sys::strerror(int error) {
  return ::strerror(error);
}

sys::pipebuild_rlim_t sys::getOpenFileLimit() {
  struct rlimit rl;
  int ret = getrlimit(RLIMIT_NOFILE, &rl);
  if (ret != 0) {
    return 0;
  }

  return rl.rlim_cur;
}

int sys::raiseOpenFileLimit(pipebuild_rlim_t limit) {
  struct rlimit rl;
  int ret = getrlimit(RLIMIT_NOFILE, &rl);
  if (ret != 0) {
    return ret;
  }

  if (rl.rlim_cur >= limit) {
    return 0;
  }

  rl.rlim_cur = std::min(limit, rl.rlim_max);

  return setrlimit(RLIMIT_NOFILE, &rl);
}

//===- PlatformUtility.h ----------------------------------------*- C++ -*-===//
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
//
// This file implements small platform compatability wrapper functions for
// common functions.
//
//===----------------------------------------------------------------------===//

#ifndef PIPEBUILD_BASIC_PLATFORMUTILITY_H
#define PIPEBUILD_BASIC_PLATFORMUTILITY_H

#include <cstdint>
#include <string>

#include <sys/resource.h>
#include <unistd.h>

namespace pipebuild {
namespace basic {
namespace sys {

typedef rlim_t pipebuild_rlim_t;

bool mkdir(const char *fileName);
int rmdir(const char *path);
int unlink(const char *fileName);
std::string strerror(int error);

/// Get the current process' soft open file limit, or 0 on failure.
pipebuild_rlim_t getOpenFileLimit();

/// Sets the max open file limit to min(max(soft_limit, limit), hard_limit),
/// where soft_limit and hard_limit are gathered from the system.
///
/// Returns: 0 on success, -1 on failure (check errno).
int raiseOpenFileLimit(pipebuild_rlim_t limit = 2048);

}
}
}

#endif

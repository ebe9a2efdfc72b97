//===- BuiltinTargets.h -----------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_BUILDSYSTEM_BUILTINTARGETS_H
#define PIPEBUILD_BUILDSYSTEM_BUILTINTARGETS_H

#include "pipebuild/Basic/Compiler.h"
#include "pipebuild/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include <memory>
#include <vector>

namespace pipebuild {
namespace buildsystem {

class Target;

/// The registry of targets known to the command line tool.
///
/// The registry owns its targets: "copy_assets", "unpack_artifacts", and the
/// aggregate "bundle" which depends on both.
class BuiltinTargets {
  std::vector<std::unique_ptr<Target>> targets;

  BuiltinTargets(const BuiltinTargets&) PIPEBUILD_DELETED_FUNCTION;
  void operator=(const BuiltinTargets&) PIPEBUILD_DELETED_FUNCTION;

public:
  /// The target built when none is named.
  static const char* const DefaultTargetName;

  BuiltinTargets();
  ~BuiltinTargets();

  /// Look up a target by name, returning null if there is none.
  Target* lookup(StringRef name) const;

  /// Get all of the targets, in registration order.
  ArrayRef<std::unique_ptr<Target>> getTargets() const { return targets; }
};

}
}

#endif

//===- Target.h -------------------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_BUILDSYSTEM_TARGET_H
#define PIPEBUILD_BUILDSYSTEM_TARGET_H

#include "pipebuild/Basic/Compiler.h"
#include "pipebuild/Basic/Hashing.h"
#include "pipebuild/Basic/LLVM.h"
#include "pipebuild/BuildSystem/Source.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <functional>
#include <string>
#include <vector>

namespace pipebuild {
namespace buildsystem {

class Environment;

/// A named unit of build work.
///
/// A target declares the targets it depends on, the sources it reads and
/// writes, and the depfiles (relative to the build directory) its action
/// emits. Dependencies are not owned; they must outlive every build of this
/// target.
class Target {
  // DO NOT COPY
  Target(const Target&) PIPEBUILD_DELETED_FUNCTION;
  void operator=(const Target&) PIPEBUILD_DELETED_FUNCTION;
  Target& operator=(Target&&) PIPEBUILD_DELETED_FUNCTION;

  std::string name;
  std::vector<Target*> dependencies;
  std::vector<Source> inputs;
  std::vector<Source> outputs;
  std::vector<std::string> depfiles;

public:
  Target(StringRef name, std::vector<Target*> dependencies,
         std::vector<Source> inputs, std::vector<Source> outputs,
         std::vector<std::string> depfiles = {});
  virtual ~Target();

  const std::string& getName() const { return name; }
  const std::vector<Target*>& getDependencies() const { return dependencies; }
  const std::vector<Source>& getInputs() const { return inputs; }
  const std::vector<Source>& getOutputs() const { return outputs; }
  const std::vector<std::string>& getDepfiles() const { return depfiles; }

  /// Add a dependency after construction, e.g. to tie targets into a graph
  /// whose members refer to each other.
  void addDependency(Target* dependency) {
    dependencies.push_back(dependency);
  }

  /// Get the signature of this declaration.
  ///
  /// Editing the name, sources or depfiles of a target changes its signature,
  /// which forces the target to rebuild.
  virtual basic::Signature getSignature() const;

  /// Perform the action of this target.
  ///
  /// The action must write every declared output and depfile. It may be invoked
  /// concurrently with the actions of unrelated targets.
  virtual llvm::Error build(const Environment& environment) = 0;
};

/// A target whose action is supplied as a function.
class CustomTarget : public Target {
public:
  typedef std::function<llvm::Error(const Environment&)> action_fn_ty;

private:
  action_fn_ty action;

public:
  CustomTarget(StringRef name, std::vector<Target*> dependencies,
               std::vector<Source> inputs, std::vector<Source> outputs,
               std::vector<std::string> depfiles, action_fn_ty action)
    : Target(name, std::move(dependencies), std::move(inputs),
             std::move(outputs), std::move(depfiles)),
      action(std::move(action)) {}

  llvm::Error build(const Environment& environment) override;
};

}
}

#endif

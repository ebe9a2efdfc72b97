//===-- Target.cpp --------------------------------------------------------===//
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

#include "pipebuild/BuildSystem/Target.h"

using namespace pipebuild;
using namespace pipebuild::buildsystem;

Target::Target(StringRef name, std::vector<Target*> dependencies,
               std::vector<Source> inputs, std::vector<Source> outputs,
               std::vector<std::string> depfiles)
  : name(name.str()), dependencies(std::move(dependencies)),
    inputs(std::move(inputs)), outputs(std::move(outputs)),
    depfiles(std::move(depfiles)) {}

Target::~Target() {}

basic::Signature Target::getSignature() const {
  basic::Signature signature(name);
  signature.combine(uint64_t(inputs.size()));
  for (const auto& input: inputs)
    signature.combine(input.toString());
  signature.combine(uint64_t(outputs.size()));
  for (const auto& output: outputs)
    signature.combine(output.toString());
  signature.combine(depfiles);
  return signature;
}

llvm::Error CustomTarget::build(const Environment& environment) {
  if (!action)
    return llvm::Error::success();
  return action(environment);
}

//===-- BuiltinTargets.cpp ------------------------------------------------===//
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

#include "pipebuild/BuildSystem/BuiltinTargets.h"

#include "pipebuild/BuildSystem/CopyAssets.h"
#include "pipebuild/BuildSystem/Target.h"
#include "pipebuild/BuildSystem/UnpackArtifacts.h"

using namespace pipebuild;
using namespace pipebuild::buildsystem;

const char* const BuiltinTargets::DefaultTargetName = "bundle";

BuiltinTargets::BuiltinTargets() {
  auto copyAssets = std::make_unique<CopyAssetsTarget>();
  auto unpackArtifacts = std::make_unique<UnpackArtifactsTarget>();
  auto bundle = std::make_unique<CustomTarget>(
      DefaultTargetName,
      std::vector<Target*>{ copyAssets.get(), unpackArtifacts.get() },
      std::vector<Source>{}, std::vector<Source>{},
      std::vector<std::string>{}, CustomTarget::action_fn_ty());

  targets.push_back(std::move(copyAssets));
  targets.push_back(std::move(unpackArtifacts));
  targets.push_back(std::move(bundle));
}

BuiltinTargets::~BuiltinTargets() {}

Target* BuiltinTargets::lookup(StringRef name) const {
  for (const auto& target: targets) {
    if (target->getName() == name)
      return target.get();
  }
  return nullptr;
}

//===-- Source.cpp --------------------------------------------------------===//
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

#include "pipebuild/BuildSystem/Source.h"

#include "pipebuild/Basic/FileSystem.h"
#include "pipebuild/BuildSystem/BuildSystemErrors.h"
#include "pipebuild/BuildSystem/Environment.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace pipebuild;
using namespace pipebuild::buildsystem;

llvm::Error buildsystem::validatePattern(StringRef pattern) {
  SmallVector<StringRef, 8> segments;
  pattern.split(segments, '/');

  if (!parseRootToken(segments.front()).hasValue()) {
    return llvm::make_error<InvalidPatternError>(
        pattern, "pattern must start with one of {PROJECT_DIR}, {BUILD_DIR}, "
        "{CACHE_DIR}, {TOOLCHAIN_ROOT} or {OUTPUT_DIR}");
  }

  for (unsigned i = 0, e = segments.size(); i + 1 < e; ++i) {
    if (segments[i].contains('*')) {
      return llvm::make_error<InvalidPatternError>(
          pattern, "a wildcard may only appear in the final segment");
    }
  }
  if (segments.back().count('*') > 1) {
    return llvm::make_error<InvalidPatternError>(
        pattern, "at most one wildcard is allowed");
  }
  return llvm::Error::success();
}

llvm::Error Source::validate() const {
  if (!isPattern())
    return llvm::Error::success();
  return validatePattern(pattern);
}

bool Source::isImplicit(const Environment& environment) const {
  switch (kind) {
  case Kind::Pattern:
    return hasWildcard();
  case Kind::Artifact:
    return environment.getFileSystem().isDirectory(
        environment.getArtifactResolver().getArtifactPath(artifact, platform,
                                                          mode));
  case Kind::HostArtifact:
    return environment.getFileSystem().isDirectory(
        environment.getArtifactResolver().getHostArtifactPath(hostArtifact));
  }
  llvm_unreachable("invalid source kind");
}

std::string Source::toString() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  switch (kind) {
  case Kind::Pattern:
    os << "pattern(" << pattern;
    if (optional)
      os << ", optional";
    os << ")";
    break;
  case Kind::Artifact:
    os << "artifact(" << getArtifactName(artifact);
    if (platform.hasValue())
      os << ", " << getTargetPlatformName(*platform);
    if (mode.hasValue())
      os << ", " << getBuildModeName(*mode);
    os << ")";
    break;
  case Kind::HostArtifact:
    os << "host-artifact(" << getHostArtifactName(hostArtifact) << ")";
    break;
  }
  os.flush();
  return result;
}

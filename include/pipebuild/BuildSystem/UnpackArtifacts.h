//===- UnpackArtifacts.h ----------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_BUILDSYSTEM_UNPACKARTIFACTS_H
#define PIPEBUILD_BUILDSYSTEM_UNPACKARTIFACTS_H

#include "pipebuild/Basic/LLVM.h"
#include "pipebuild/BuildSystem/Target.h"
#include "pipebuild/Core/Depfile.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace pipebuild {
namespace basic {
  class FileSystem;
}

namespace buildsystem {

/// Copy the named files or directories of \arg artifactDirectory, and every
/// file beneath \arg clientSourceDirectory if given, into
/// \arg outputDirectory.
///
/// Directory contents keep their paths relative to the directory being
/// copied.
///
/// \returns The copied inputs and produced outputs, or an error if a named
/// artifact or the client source directory does not exist, or a copy fails.
llvm::Expected<core::Depfile>
unpackArtifacts(basic::FileSystem& fileSystem,
                const std::string& artifactDirectory,
                const std::string& outputDirectory,
                ArrayRef<std::string> artifacts,
                const llvm::Optional<std::string>& clientSourceDirectory);

/// Unpacks the desktop runtime into the output directory.
///
/// The artifact names come from the comma separated "Artifacts" define, and
/// the optional client wrapper sources from the "ClientSourceDirectory"
/// define, relative to the project directory.
class UnpackArtifactsTarget : public Target {
public:
  static const char* const Name;
  static const char* const DepfileName;

  explicit UnpackArtifactsTarget(std::vector<Target*> dependencies = {});

  llvm::Error build(const Environment& environment) override;
};

}
}

#endif

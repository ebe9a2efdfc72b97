//===- CopyAssets.h ---------------------------------------------*- C++ -*-===//
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
// This file declares the asset copying action, which copies the entries of an
// asset manifest into the output directory through a bounded pool of lanes.
//
//===----------------------------------------------------------------------===//

#ifndef PIPEBUILD_BUILDSYSTEM_COPYASSETS_H
#define PIPEBUILD_BUILDSYSTEM_COPYASSETS_H

#include "pipebuild/Basic/LLVM.h"
#include "pipebuild/BuildSystem/Target.h"
#include "pipebuild/Core/Depfile.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace pipebuild {
namespace buildsystem {

class Environment;

/// One entry of an asset manifest.
struct AssetEntry {
  /// The destination, relative to the output directory.
  std::string path;

  /// The file to copy, if the entry is not inline.
  llvm::Optional<std::string> sourcePath;

  /// The contents to write, for an inline entry.
  std::string contents;
};

/// Parse an asset manifest.
///
/// The manifest is a JSON array of objects, each with a "path" and either a
/// "source" file or inline "contents". Relative sources are resolved against
/// \arg baseDirectory.
llvm::Expected<std::vector<AssetEntry>>
parseAssetManifest(StringRef json, StringRef manifestPath,
                   StringRef baseDirectory);

/// Copy every entry into \arg outputDirectory.
///
/// Each entry is copied by an independent job; a failed entry does not stop
/// the others. Once every job has completed, all failures are reported
/// together as an AssetCopyError.
///
/// \param numLanes The maximum number of concurrent copies, further capped by
/// the open file limit.
/// \returns The consumed source files and produced output files.
llvm::Expected<core::Depfile> copyAssets(const Environment& environment,
                                         ArrayRef<AssetEntry> entries,
                                         StringRef outputDirectory,
                                         unsigned numLanes = 64);

/// Copies the project's asset manifest into the output directory.
///
/// The manifest is read from "{PROJECT_DIR}/asset_manifest.json"; the copied
/// files are recorded in the "assets.d" depfile.
class CopyAssetsTarget : public Target {
  unsigned numLanes;

public:
  static const char* const Name;
  static const char* const ManifestPattern;
  static const char* const DepfileName;

  explicit CopyAssetsTarget(std::vector<Target*> dependencies = {},
                            unsigned numLanes = 64);

  llvm::Error build(const Environment& environment) override;
};

}
}

#endif

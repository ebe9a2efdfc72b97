//===-- CopyAssets.cpp ----------------------------------------------------===//
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

#include "pipebuild/BuildSystem/CopyAssets.h"

#include "pipebuild/Basic/ExecutionQueue.h"
#include "pipebuild/Basic/FileSystem.h"
#include "pipebuild/Basic/Logger.h"
#include "pipebuild/BuildSystem/BuildSystemErrors.h"
#include "pipebuild/BuildSystem/Environment.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Errc.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <algorithm>
#include <memory>
#include <mutex>

using namespace pipebuild;
using namespace pipebuild::basic;
using namespace pipebuild::buildsystem;

llvm::Expected<std::vector<AssetEntry>>
buildsystem::parseAssetManifest(StringRef json, StringRef manifestPath,
                                StringRef baseDirectory) {
  auto value = llvm::json::parse(json);
  if (!value) {
    return llvm::createStringError(
        llvm::errc::invalid_argument, "%s: invalid asset manifest: %s",
        manifestPath.str().c_str(),
        llvm::toString(value.takeError()).c_str());
  }

  auto* array = value->getAsArray();
  if (!array) {
    return llvm::createStringError(
        llvm::errc::invalid_argument,
        "%s: asset manifest must be an array", manifestPath.str().c_str());
  }

  std::vector<AssetEntry> entries;
  for (unsigned i = 0, e = array->size(); i != e; ++i) {
    auto* object = (*array)[i].getAsObject();
    llvm::Optional<StringRef> path;
    if (object)
      path = object->getString("path");
    if (!path || path->empty()) {
      return llvm::createStringError(
          llvm::errc::invalid_argument,
          "%s: asset manifest entry %u has no 'path'",
          manifestPath.str().c_str(), i);
    }

    AssetEntry entry;
    entry.path = path->str();
    if (auto source = object->getString("source")) {
      SmallString<256> sourcePath(*source);
      llvm::sys::fs::make_absolute(baseDirectory, sourcePath);
      llvm::sys::path::remove_dots(sourcePath, /*remove_dot_dot=*/true);
      entry.sourcePath = sourcePath.str().str();
    } else if (auto contents = object->getString("contents")) {
      entry.contents = contents->str();
    } else {
      return llvm::createStringError(
          llvm::errc::invalid_argument,
          "%s: asset manifest entry '%s' has neither 'source' nor 'contents'",
          manifestPath.str().c_str(), entry.path.c_str());
    }
    entries.push_back(std::move(entry));
  }
  return std::move(entries);
}

namespace {

/// The shared state of one copy operation.
struct CopyState {
  FileSystem& fileSystem;

  /// The absolute destination of each entry.
  std::vector<std::string> destinations;

  std::mutex failuresMutex;
  std::vector<std::pair<unsigned, AssetCopyError::Failure>> failures;

  explicit CopyState(FileSystem& fileSystem) : fileSystem(fileSystem) {}

  void addFailure(unsigned index, const AssetEntry& entry,
                  const llvm::Twine& message) {
    std::lock_guard<std::mutex> guard(failuresMutex);
    failures.push_back({ index, { entry.path, message.str() } });
  }

  void copyEntry(QueueJobContext* context, unsigned index,
                 const AssetEntry& entry) {
    if (context->isCancelled()) {
      addFailure(index, entry, "cancelled");
      return;
    }

    const std::string& destination = destinations[index];
    std::string parent = llvm::sys::path::parent_path(destination).str();
    if (!fileSystem.createDirectories(parent)) {
      addFailure(index, entry,
                 llvm::Twine("unable to create directory '") + parent + "'");
      return;
    }

    if (entry.sourcePath.hasValue()) {
      const std::string& source = entry.sourcePath.getValue();
      if (!fileSystem.getFileInfo(source).isRegularFile()) {
        addFailure(index, entry,
                   llvm::Twine("missing source file '") + source + "'");
        return;
      }
      if (!fileSystem.copyFile(source, destination)) {
        addFailure(index, entry, llvm::Twine("unable to copy '") + source +
                   "' to '" + destination + "'");
      }
      return;
    }

    if (!fileSystem.writeFileContents(destination, entry.contents)) {
      addFailure(index, entry,
                 llvm::Twine("unable to write '") + destination + "'");
    }
  }
};

typedef std::pair<unsigned, AssetCopyError::Failure> IndexedFailure;

/// Check if the normalized \arg path names something strictly inside the
/// normalized \arg directory.
static bool isWithinDirectory(StringRef path, StringRef directory) {
  if (directory.empty() || !path.startswith(directory) ||
      path.size() == directory.size())
    return false;
  return llvm::sys::path::is_separator(directory.back()) ||
    llvm::sys::path::is_separator(path[directory.size()]);
}

static llvm::Error reportFailures(const Environment& environment,
                                  std::vector<IndexedFailure>& indexed) {
  std::sort(indexed.begin(), indexed.end(),
            [](const IndexedFailure& lhs, const IndexedFailure& rhs) {
              return lhs.first < rhs.first;
            });
  std::vector<AssetCopyError::Failure> failures;
  for (auto& failure: indexed) {
    environment.getLogger().error(llvm::Twine("unable to copy asset '") +
                                  failure.second.path + "': " +
                                  failure.second.message);
    failures.push_back(std::move(failure.second));
  }
  return llvm::make_error<AssetCopyError>(std::move(failures));
}

}

llvm::Expected<core::Depfile>
buildsystem::copyAssets(const Environment& environment,
                        ArrayRef<AssetEntry> entries,
                        StringRef outputDirectory, unsigned numLanes) {
  SmallString<256> root(outputDirectory);
  llvm::sys::path::remove_dots(root, /*remove_dot_dot=*/true);

  // Every destination must stay inside the output directory; nothing is
  // copied otherwise.
  CopyState state(environment.getFileSystem());
  std::vector<IndexedFailure> escaping;
  for (unsigned i = 0, e = entries.size(); i != e; ++i) {
    SmallString<256> destination(root);
    llvm::sys::path::append(destination, entries[i].path);
    llvm::sys::path::remove_dots(destination, /*remove_dot_dot=*/true);
    if (!isWithinDirectory(destination, root)) {
      escaping.push_back({ i, { entries[i].path,
              (llvm::Twine("path is outside the output directory '") +
               root + "'").str() } });
    }
    state.destinations.push_back(destination.str().str());
  }
  if (!escaping.empty())
    return reportFailures(environment, escaping);

  {
    NullExecutionQueueDelegate delegate;
    auto queue = createLaneBasedExecutionQueue(delegate, numLanes);
    std::vector<std::unique_ptr<NamedJobDescriptor>> descriptors;
    descriptors.reserve(entries.size());
    for (unsigned i = 0, e = entries.size(); i != e; ++i) {
      const AssetEntry& entry = entries[i];
      descriptors.push_back(std::make_unique<NamedJobDescriptor>(entry.path));
      queue->addJob(QueueJob(descriptors.back().get(),
                             [&state, &entry, i](QueueJobContext* context) {
                               state.copyEntry(context, i, entry);
                             }));
    }
    queue->waitForAllJobs();
  }

  if (!state.failures.empty())
    return reportFailures(environment, state.failures);

  core::Depfile depfile;
  for (unsigned i = 0, e = entries.size(); i != e; ++i) {
    if (entries[i].sourcePath.hasValue())
      depfile.addInput(entries[i].sourcePath.getValue());
    depfile.addOutput(state.destinations[i]);
  }
  return std::move(depfile);
}

#pragma mark - CopyAssetsTarget

const char* const CopyAssetsTarget::Name = "copy_assets";
const char* const CopyAssetsTarget::ManifestPattern =
    "{PROJECT_DIR}/asset_manifest.json";
const char* const CopyAssetsTarget::DepfileName = "assets.d";

CopyAssetsTarget::CopyAssetsTarget(std::vector<Target*> dependencies,
                                   unsigned numLanes)
  : Target(Name, std::move(dependencies),
           { Source::makePattern(ManifestPattern) }, {}, { DepfileName }),
    numLanes(numLanes) {}

llvm::Error CopyAssetsTarget::build(const Environment& environment) {
  auto& fileSystem = environment.getFileSystem();

  SmallString<256> manifestPath(environment.getProjectDirectory());
  llvm::sys::path::append(manifestPath, "asset_manifest.json");
  auto buffer = fileSystem.getFileContents(manifestPath.str().str());
  if (!buffer) {
    return llvm::createStringError(
        llvm::errc::no_such_file_or_directory,
        "unable to read asset manifest '%s'", manifestPath.c_str());
  }

  auto entries = parseAssetManifest(buffer->getBuffer(), manifestPath,
                                    environment.getProjectDirectory());
  if (!entries)
    return entries.takeError();

  auto depfile = copyAssets(environment, *entries,
                            environment.getOutputDirectory(), numLanes);
  if (!depfile)
    return depfile.takeError();
  depfile->addInput(manifestPath);

  SmallString<256> depfilePath(environment.getBuildDirectory());
  llvm::sys::path::append(depfilePath, DepfileName);
  return depfile->writeToFile(fileSystem, depfilePath.str().str());
}

//===-- SourceVisitor.cpp -------------------------------------------------===//
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

#include "pipebuild/BuildSystem/SourceVisitor.h"

#include "pipebuild/Basic/FileSystem.h"
#include "pipebuild/Basic/Logger.h"
#include "pipebuild/BuildSystem/BuildSystemErrors.h"
#include "pipebuild/BuildSystem/Environment.h"
#include "pipebuild/BuildSystem/Source.h"
#include "pipebuild/Core/Depfile.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/Path.h"

#include <utility>

using namespace pipebuild;
using namespace pipebuild::buildsystem;

namespace {

/// Appends paths to a result, dropping duplicates.
class ResultBuilder {
  ResolvedFiles result;
  llvm::StringSet<> seen;

public:
  void add(StringRef path) {
    if (seen.insert(path).second)
      result.sources.push_back(path.str());
  }

  void add(const ResolvedFiles& files) {
    for (const auto& path: files.sources)
      add(path);
    if (files.containsNewDepfile)
      result.containsNewDepfile = true;
  }

  ResolvedFiles take() { return std::move(result); }
};

/// Match a file name against the literal fragments around a wildcard.
bool matchesWildcard(StringRef name, ArrayRef<StringRef> fragments) {
  switch (fragments.size()) {
  case 0:
    return true;
  case 1:
    return name.startswith(fragments[0]) || name.endswith(fragments[0]);
  case 2:
    return name.startswith(fragments[0]) &&
      name.substr(fragments[0].size()).endswith(fragments[1]);
  default:
    return false;
  }
}

}

llvm::Expected<ResolvedFiles>
SourceVisitor::resolve(ArrayRef<Source> sources,
                       ArrayRef<std::string> depfiles) const {
  ResultBuilder builder;
  for (const auto& source: sources) {
    auto files = visit(source);
    if (!files)
      return files.takeError();
    builder.add(*files);
  }
  for (const auto& depfile: depfiles) {
    builder.add(visitDepfile(depfile));
  }
  return builder.take();
}

llvm::Expected<ResolvedFiles> SourceVisitor::visit(const Source& source) const {
  switch (source.getKind()) {
  case Source::Kind::Pattern:
    return visitPattern(source.getPattern(), source.isOptional());
  case Source::Kind::Artifact:
    return visitArtifact(source.getArtifact(), source.getPlatform(),
                         source.getMode());
  case Source::Kind::HostArtifact:
    return visitHostArtifact(source.getHostArtifact());
  }
  llvm_unreachable("invalid source kind");
}

llvm::Expected<ResolvedFiles>
SourceVisitor::visitPattern(StringRef pattern, bool optional) const {
  auto& fileSystem = environment.getFileSystem();

  if (auto error = validatePattern(pattern))
    return std::move(error);

  SmallVector<StringRef, 8> segments;
  pattern.split(segments, '/');
  auto token = parseRootToken(segments.front());

  bool hasWildcard = segments.size() > 1 && segments.back().contains('*');
  StringRef wildcardSegment;
  if (hasWildcard) {
    wildcardSegment = segments.back();
    segments.pop_back();
  }

  // The toolchain root is not expected to contain symbolic links.
  const std::string& root = environment.getRootDirectory(*token);
  SmallString<256> path(*token == RootToken::ToolchainRoot
                        ? root : fileSystem.getRealPath(root));
  for (auto segment: llvm::makeArrayRef(segments).slice(1)) {
    if (!segment.empty())
      llvm::sys::path::append(path, segment);
  }
  llvm::sys::path::remove_dots(path, /*remove_dot_dot:*/ true);

  ResultBuilder builder;
  if (!hasWildcard) {
    std::string filePath = path.str().str();
    if (!fileSystem.getFileInfo(filePath).isMissing()) {
      builder.add(filePath);
    } else if (optional) {
      // Missing optional files are not part of the fingerprint.
    } else if (inputs) {
      return llvm::make_error<MissingInputError>(filePath, pattern);
    } else {
      // Outputs need not exist before the target runs.
      builder.add(filePath);
    }
    return builder.take();
  }

  // Split the wildcard segment into the literal fragments around the '*'.
  SmallVector<StringRef, 2> fragments;
  wildcardSegment.split(fragments, '*', /*MaxSplit:*/ -1, /*KeepEmpty:*/ false);

  std::string directory = path.str().str();
  if (!fileSystem.isDirectory(directory) &&
      !fileSystem.createDirectories(directory)) {
    environment.getLogger().error(llvm::Twine("unable to create directory '") +
                                  directory + "' for pattern '" + pattern +
                                  "'");
    return builder.take();
  }

  std::vector<std::string> entries;
  if (!fileSystem.listDirectory(directory, /*recursive:*/ false, entries)) {
    environment.getLogger().error(llvm::Twine("unable to list directory '") +
                                  directory + "' for pattern '" + pattern +
                                  "'");
    return builder.take();
  }
  for (const auto& entry: entries) {
    if (fileSystem.isDirectory(entry))
      continue;
    if (matchesWildcard(llvm::sys::path::filename(entry), fragments))
      builder.add(entry);
  }
  return builder.take();
}

ResolvedFiles SourceVisitor::visitArtifactPath(const std::string& path) const {
  ResultBuilder builder;

  // With a pinned toolchain, one marker file stands in for every artifact.
  if (environment.getToolchainVersion().hasValue()) {
    builder.add(environment.getToolchainVersionMarkerPath());
    return builder.take();
  }

  auto& fileSystem = environment.getFileSystem();
  if (fileSystem.isDirectory(path)) {
    std::vector<std::string> entries;
    if (!fileSystem.listDirectory(path, /*recursive:*/ true, entries)) {
      environment.getLogger().error(
          llvm::Twine("unable to list artifact directory '") + path + "'");
    }
    for (const auto& entry: entries)
      builder.add(entry);
    return builder.take();
  }

  builder.add(path);
  return builder.take();
}

ResolvedFiles
SourceVisitor::visitArtifact(Artifact artifact,
                             llvm::Optional<TargetPlatform> platform,
                             llvm::Optional<BuildMode> mode) const {
  return visitArtifactPath(
      environment.getArtifactResolver().getArtifactPath(artifact, platform,
                                                        mode));
}

ResolvedFiles SourceVisitor::visitHostArtifact(HostArtifact artifact) const {
  return visitArtifactPath(
      environment.getArtifactResolver().getHostArtifactPath(artifact));
}

ResolvedFiles SourceVisitor::visitDepfile(StringRef name) const {
  ResultBuilder builder;

  SmallString<256> path(environment.getBuildDirectory());
  llvm::sys::path::append(path, name);
  std::string depfilePath = path.str().str();

  auto& fileSystem = environment.getFileSystem();
  if (fileSystem.getFileInfo(depfilePath).isMissing()) {
    ResolvedFiles result;
    result.containsNewDepfile = true;
    return result;
  }

  auto depfile = core::Depfile::readFromFile(fileSystem, depfilePath);
  if (!depfile) {
    environment.getLogger().error(llvm::toString(depfile.takeError()));
    return builder.take();
  }

  for (const auto& file: inputs ? depfile->getInputs()
                                : depfile->getOutputs()) {
    builder.add(file);
  }
  return builder.take();
}

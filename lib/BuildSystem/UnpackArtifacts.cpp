//===-- UnpackArtifacts.cpp -----------------------------------------------===//
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

#include "pipebuild/BuildSystem/UnpackArtifacts.h"

#include "pipebuild/Basic/FileSystem.h"
#include "pipebuild/BuildSystem/Artifacts.h"
#include "pipebuild/BuildSystem/Environment.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Errc.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

using namespace pipebuild;
using namespace pipebuild::buildsystem;

/// Copy \arg source to \arg destination, recording both in \arg depfile.
static llvm::Error copyTracked(basic::FileSystem& fileSystem,
                               const std::string& source,
                               const std::string& destination,
                               core::Depfile& depfile) {
  if (!fileSystem.copyFile(source, destination)) {
    return llvm::createStringError(llvm::errc::io_error,
                                   "unable to copy '%s' to '%s'",
                                   source.c_str(), destination.c_str());
  }
  depfile.addInput(source);
  depfile.addOutput(destination);
  return llvm::Error::success();
}

/// Copy every file beneath \arg directory into \arg outputDirectory, keeping
/// relative paths.
static llvm::Error copyDirectory(basic::FileSystem& fileSystem,
                                 const std::string& directory,
                                 StringRef outputDirectory,
                                 core::Depfile& depfile) {
  std::vector<std::string> files;
  if (!fileSystem.listDirectory(directory, /*recursive=*/true, files)) {
    return llvm::createStringError(llvm::errc::io_error,
                                   "unable to list directory '%s'",
                                   directory.c_str());
  }

  for (const auto& file: files) {
    SmallString<256> relative(file);
    llvm::sys::path::replace_path_prefix(relative, directory, "");
    SmallString<256> destination(outputDirectory);
    llvm::sys::path::append(destination, llvm::sys::path::relative_path(
                                             relative.str()));
    if (auto error = copyTracked(fileSystem, file, destination.str().str(),
                                 depfile))
      return error;
  }
  return llvm::Error::success();
}

llvm::Expected<core::Depfile> buildsystem::unpackArtifacts(
    basic::FileSystem& fileSystem, const std::string& artifactDirectory,
    const std::string& outputDirectory, ArrayRef<std::string> artifacts,
    const llvm::Optional<std::string>& clientSourceDirectory) {
  core::Depfile depfile;

  for (const auto& artifact: artifacts) {
    SmallString<256> source(artifactDirectory);
    llvm::sys::path::append(source, artifact);
    auto info = fileSystem.getFileInfo(source.str().str());
    if (info.isMissing()) {
      return llvm::createStringError(llvm::errc::no_such_file_or_directory,
                                     "missing artifact '%s'", source.c_str());
    }

    SmallString<256> destination(outputDirectory);
    llvm::sys::path::append(destination, artifact);
    if (info.isDirectory()) {
      if (auto error = copyDirectory(fileSystem, source.str().str(),
                                     destination, depfile))
        return std::move(error);
    } else if (auto error = copyTracked(fileSystem, source.str().str(),
                                        destination.str().str(), depfile)) {
      return std::move(error);
    }
  }

  if (clientSourceDirectory.hasValue()) {
    const std::string& directory = clientSourceDirectory.getValue();
    if (!fileSystem.isDirectory(directory)) {
      return llvm::createStringError(llvm::errc::no_such_file_or_directory,
                                     "missing client source directory '%s'",
                                     directory.c_str());
    }
    if (auto error = copyDirectory(fileSystem, directory, outputDirectory,
                                   depfile))
      return std::move(error);
  }

  return std::move(depfile);
}

#pragma mark - UnpackArtifactsTarget

const char* const UnpackArtifactsTarget::Name = "unpack_artifacts";
const char* const UnpackArtifactsTarget::DepfileName = "unpack_artifacts.d";

UnpackArtifactsTarget::UnpackArtifactsTarget(std::vector<Target*> dependencies)
  : Target(Name, std::move(dependencies),
           { Source::makeHostArtifact(HostArtifact::DesktopRuntime) }, {},
           { DepfileName }) {}

llvm::Error UnpackArtifactsTarget::build(const Environment& environment) {
  std::vector<std::string> artifacts;
  if (auto define = environment.getDefine("Artifacts")) {
    SmallVector<StringRef, 8> names;
    define->split(names, ',', /*MaxSplit=*/-1, /*KeepEmpty=*/false);
    for (auto name: names) {
      name = name.trim();
      if (!name.empty())
        artifacts.push_back(name.str());
    }
  }

  llvm::Optional<std::string> clientSourceDirectory;
  if (auto define = environment.getDefine("ClientSourceDirectory")) {
    SmallString<256> directory(*define);
    llvm::sys::fs::make_absolute(environment.getProjectDirectory(), directory);
    llvm::sys::path::remove_dots(directory, /*remove_dot_dot=*/true);
    clientSourceDirectory = directory.str().str();
  }

  std::string artifactDirectory = environment.getArtifactResolver()
      .getHostArtifactPath(HostArtifact::DesktopRuntime);
  auto depfile = unpackArtifacts(environment.getFileSystem(),
                                 artifactDirectory,
                                 environment.getOutputDirectory(), artifacts,
                                 clientSourceDirectory);
  if (!depfile)
    return depfile.takeError();

  SmallString<256> depfilePath(environment.getBuildDirectory());
  llvm::sys::path::append(depfilePath, DepfileName);
  return depfile->writeToFile(environment.getFileSystem(),
                              depfilePath.str().str());
}

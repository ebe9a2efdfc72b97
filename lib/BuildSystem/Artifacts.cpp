//===-- Artifacts.cpp -----------------------------------------------------===//
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

#include "pipebuild/BuildSystem/Artifacts.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/Path.h"

using namespace pipebuild;
using namespace pipebuild::buildsystem;

StringRef buildsystem::getArtifactName(Artifact artifact) {
  switch (artifact) {
  case Artifact::Snapshotter: return "snapshotter";
  case Artifact::RuntimeLibrary: return "runtime_library";
  case Artifact::RuntimeHeaders: return "runtime_headers";
  case Artifact::ClientWrapper: return "client_wrapper";
  }
  llvm_unreachable("invalid artifact");
}

StringRef buildsystem::getHostArtifactName(HostArtifact artifact) {
  switch (artifact) {
  case HostArtifact::SdkRoot: return "sdk";
  case HostArtifact::PlatformKernel: return "platform_kernel.dill";
  case HostArtifact::IconFont: return "icon_font.otf";
  case HostArtifact::ShaderCompiler: return "shader_compiler";
  case HostArtifact::DesktopRuntime: return "desktop_runtime";
  }
  llvm_unreachable("invalid host artifact");
}

StringRef buildsystem::getTargetPlatformName(TargetPlatform platform) {
  switch (platform) {
  case TargetPlatform::LinuxX64: return "linux-x64";
  case TargetPlatform::LinuxArm64: return "linux-arm64";
  case TargetPlatform::DarwinX64: return "darwin-x64";
  case TargetPlatform::WindowsX64: return "windows-x64";
  case TargetPlatform::AndroidArm64: return "android-arm64";
  }
  llvm_unreachable("invalid target platform");
}

StringRef buildsystem::getBuildModeName(BuildMode mode) {
  switch (mode) {
  case BuildMode::Debug: return "debug";
  case BuildMode::Profile: return "profile";
  case BuildMode::Release: return "release";
  }
  llvm_unreachable("invalid build mode");
}

llvm::Optional<Artifact> buildsystem::parseArtifact(StringRef name) {
  return llvm::StringSwitch<llvm::Optional<Artifact>>(name)
    .Case("snapshotter", Artifact::Snapshotter)
    .Case("runtime_library", Artifact::RuntimeLibrary)
    .Case("runtime_headers", Artifact::RuntimeHeaders)
    .Case("client_wrapper", Artifact::ClientWrapper)
    .Default(llvm::None);
}

llvm::Optional<HostArtifact> buildsystem::parseHostArtifact(StringRef name) {
  return llvm::StringSwitch<llvm::Optional<HostArtifact>>(name)
    .Case("sdk", HostArtifact::SdkRoot)
    .Case("platform_kernel.dill", HostArtifact::PlatformKernel)
    .Case("icon_font.otf", HostArtifact::IconFont)
    .Case("shader_compiler", HostArtifact::ShaderCompiler)
    .Case("desktop_runtime", HostArtifact::DesktopRuntime)
    .Default(llvm::None);
}

llvm::Optional<TargetPlatform> buildsystem::parseTargetPlatform(StringRef name) {
  return llvm::StringSwitch<llvm::Optional<TargetPlatform>>(name)
    .Case("linux-x64", TargetPlatform::LinuxX64)
    .Case("linux-arm64", TargetPlatform::LinuxArm64)
    .Case("darwin-x64", TargetPlatform::DarwinX64)
    .Case("windows-x64", TargetPlatform::WindowsX64)
    .Case("android-arm64", TargetPlatform::AndroidArm64)
    .Default(llvm::None);
}

llvm::Optional<BuildMode> buildsystem::parseBuildMode(StringRef name) {
  return llvm::StringSwitch<llvm::Optional<BuildMode>>(name)
    .Case("debug", BuildMode::Debug)
    .Case("profile", BuildMode::Profile)
    .Case("release", BuildMode::Release)
    .Default(llvm::None);
}

ArtifactResolver::~ArtifactResolver() {}

std::string
DirectoryArtifactResolver::getArtifactPath(Artifact artifact,
                                           llvm::Optional<TargetPlatform> platform,
                                           llvm::Optional<BuildMode> mode) const {
  SmallString<256> directoryName(
      platform.hasValue() ? getTargetPlatformName(*platform) : "common");
  if (mode.hasValue()) {
    directoryName += "-";
    directoryName += getBuildModeName(*mode);
  }

  SmallString<256> path(root);
  llvm::sys::path::append(path, directoryName, getArtifactName(artifact));
  return path.str().str();
}

std::string
DirectoryArtifactResolver::getHostArtifactPath(HostArtifact artifact) const {
  SmallString<256> path(root);
  llvm::sys::path::append(path, "host", getHostArtifactName(artifact));
  return path.str().str();
}

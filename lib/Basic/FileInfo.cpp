//===-- FileInfo.cpp ------------------------------------------------------===//
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

#include "pipebuild/Basic/FileInfo.h"

#include "pipebuild/Basic/Stat.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/MD5.h"

#include <algorithm>
#include <cstdio>
#include <cstring>

using namespace pipebuild;
using namespace pipebuild::basic;

FileChecksum FileChecksum::getChecksumForPath(const std::string& path) {
  FileChecksum result;

  FILE* file = std::fopen(path.c_str(), "rb");
  if (file == nullptr)
    return result;

  llvm::MD5 hasher;
  uint8_t buffer[4*4096];
  size_t bytesRead = 0;
  while ((bytesRead = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
    hasher.update(llvm::ArrayRef<uint8_t>(buffer, bytesRead));
  }
  bool hadError = std::ferror(file) != 0;
  std::fclose(file);
  if (hadError)
    return result;

  llvm::MD5::MD5Result digest;
  hasher.final(digest);
  std::copy(digest.Bytes.begin(), digest.Bytes.end(), result.bytes);
  return result;
}

bool FileInfo::isDirectory() const {
  return S_ISDIR(mode);
}

bool FileInfo::isRegularFile() const {
  return S_ISREG(mode);
}

bool FileInfo::isUpToDate(const FileInfo& current) const {
  if (isMissing() || current.isMissing())
    return isMissing() && current.isMissing();
  if (size != current.size)
    return false;
  if (modTime == current.modTime)
    return true;
  // The timestamp moved; fall back to comparing contents.
  if (checksum.isNull() || current.checksum.isNull())
    return false;
  return checksum == current.checksum;
}

FileInfo FileInfo::getInfoForPath(const std::string& path, bool asLink) {
  FileInfo result;

  sys::StatStruct buf;
  auto statResult =
    asLink ? sys::lstat(path.c_str(), &buf) : sys::stat(path.c_str(), &buf);
  if (statResult != 0) {
    return FileInfo();
  }

  result.mode = buf.st_mode;
  result.size = buf.st_size;
#if defined(__APPLE__)
  auto seconds = buf.st_mtimespec.tv_sec;
  auto nanoseconds = buf.st_mtimespec.tv_nsec;
#else
  auto seconds = buf.st_mtim.tv_sec;
  auto nanoseconds = buf.st_mtim.tv_nsec;
#endif
  result.modTime.seconds = seconds;
  result.modTime.nanoseconds = nanoseconds;

  // Enforce we never accidentally create our sentinel missing file value.
  if (result.isMissing()) {
    result.modTime.nanoseconds = 1;
  }

  return result;
}

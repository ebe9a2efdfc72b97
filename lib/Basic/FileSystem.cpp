//===-- FileSystem.cpp ----------------------------------------------------===//
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

#include "pipebuild/Basic/FileSystem.h"
#include "pipebuild/Basic/PlatformUtility.h"
#include "pipebuild/Basic/Stat.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cerrno>

using namespace pipebuild;
using namespace pipebuild::basic;

namespace {

std::error_code removeAllRecursive(StringRef path, uint32_t &count) {
  sys::StatStruct statbuf;
  if (sys::lstat(path.str().c_str(), &statbuf) != 0)
    return std::error_code(errno, std::generic_category());

  if (S_ISDIR(statbuf.st_mode)) {
    std::error_code ec;
    for (llvm::sys::fs::directory_iterator i(path, ec, /*follow:*/ false), e;
         i != e; i.increment(ec)) {
      if (ec)
        return ec;
      if (auto ec = removeAllRecursive(i->path(), count))
        return ec;
    }
    if (ec)
      return ec;
  }

  if (auto ec = llvm::sys::fs::remove(path, /*IgnoreNonExisting:*/ false))
    return ec;

  ++count;
  return std::error_code();
}

}

FileSystem::~FileSystem() {}

bool FileSystem::createDirectories(const std::string& path) {
  // Attempt to create the final directory first, to optimize for the common
  // case where we don't need to recurse.
  if (createDirectory(path))
    return true;

  // If that failed, attempt to create the parent.
  StringRef parent = llvm::sys::path::parent_path(path);
  if (parent.empty())
    return false;
  return createDirectories(parent.str()) && createDirectory(path);
}

bool FileSystem::copyFile(const std::string& from, const std::string& to) {
  auto contents = getFileContents(from);
  if (!contents)
    return false;

  StringRef parent = llvm::sys::path::parent_path(to);
  if (!parent.empty() && !createDirectories(parent.str()))
    return false;

  return writeFileContents(to, contents->getBuffer());
}

namespace {

class LocalFileSystem : public FileSystem {
public:
  LocalFileSystem() {}

  virtual bool
  createDirectory(const std::string& path) override {
    if (!sys::mkdir(path.c_str())) {
      if (errno != EEXIST) {
        return false;
      }
      // Something exists at the path; it must be a directory.
      return FileInfo::getInfoForPath(path).isDirectory();
    }
    return true;
  }

  virtual std::unique_ptr<llvm::MemoryBuffer>
  getFileContents(const std::string& path) override {
    auto result = llvm::MemoryBuffer::getFile(path, /*IsText:*/ false,
                                              /*RequiresNullTerminator:*/ false);
    if (result.getError()) {
      return nullptr;
    }
    return std::move(*result);
  }

  virtual bool writeFileContents(const std::string& path,
                                 StringRef contents) override {
    std::error_code ec;
    llvm::raw_fd_ostream os(path, ec, llvm::sys::fs::OF_None);
    if (ec)
      return false;
    os << contents;
    os.close();
    if (os.has_error()) {
      os.clear_error();
      return false;
    }
    return true;
  }

  virtual bool listDirectory(const std::string& path, bool recursive,
                             std::vector<std::string>& entries_out) override {
    std::vector<std::string> entries;
    std::error_code ec;
    if (recursive) {
      for (llvm::sys::fs::recursive_directory_iterator i(path, ec), e;
           i != e; i.increment(ec)) {
        if (ec)
          return false;
        if (FileInfo::getInfoForPath(i->path()).isRegularFile())
          entries.push_back(i->path());
      }
    } else {
      for (llvm::sys::fs::directory_iterator i(path, ec), e;
           i != e; i.increment(ec)) {
        if (ec)
          return false;
        entries.push_back(i->path());
      }
    }
    if (ec)
      return false;

    // Directory iteration order is file system dependent.
    std::sort(entries.begin(), entries.end());
    entries_out = std::move(entries);
    return true;
  }

  virtual std::string getRealPath(const std::string& path) override {
    llvm::SmallString<256> result;
    if (llvm::sys::fs::real_path(path, result))
      return path;
    return result.str().str();
  }

  virtual bool remove(const std::string& path) override {
    // Assume `path` is a regular file.
    if (sys::unlink(path.c_str()) == 0) {
      return true;
    }

    // Error can't be that `path` is actually a directory (on Linux `EISDIR`
    // will be returned since 2.1.132).
    if (errno != EPERM && errno != EISDIR) {
      return false;
    }

    // Check if `path` is a directory.
    sys::StatStruct statbuf;
    if (sys::lstat(path.c_str(), &statbuf) != 0) {
      return false;
    }

    if (S_ISDIR(statbuf.st_mode)) {
      if (sys::rmdir(path.c_str()) == 0) {
        return true;
      }
      uint32_t count = 0;
      return !removeAllRecursive(path, count);
    }

    return false;
  }

  virtual FileInfo getFileInfo(const std::string& path) override {
    return FileInfo::getInfoForPath(path);
  }

  virtual FileInfo getLinkInfo(const std::string& path) override {
    return FileInfo::getInfoForPath(path, /*isLink:*/ true);
  }

  virtual FileChecksum getFileChecksum(const std::string& path) override {
    return FileChecksum::getChecksumForPath(path);
  }
};

}

std::unique_ptr<FileSystem> basic::createLocalFileSystem() {
  return std::make_unique<LocalFileSystem>();
}

//===- FileSystem.h ---------------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_BASIC_FILESYSTEM_H
#define PIPEBUILD_BASIC_FILESYSTEM_H

#include "pipebuild/Basic/Compiler.h"
#include "pipebuild/Basic/FileInfo.h"
#include "pipebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>
#include <vector>

namespace llvm {

class MemoryBuffer;

}

namespace pipebuild {
namespace basic {

// Abstract interface for interacting with a file system. This allows mocking of
// operations for testing, and for clients to provide virtualized interfaces.
//
// All operations must be safe to call concurrently from multiple threads.
class FileSystem  {
  // DO NOT COPY
  FileSystem(const FileSystem&) PIPEBUILD_DELETED_FUNCTION;
  void operator=(const FileSystem&) PIPEBUILD_DELETED_FUNCTION;
  FileSystem &operator=(FileSystem&& rhs) PIPEBUILD_DELETED_FUNCTION;

public:
  FileSystem() {}
  virtual ~FileSystem();

  /// Create the given directory if it does not exist.
  ///
  /// \returns True on success (the directory was created, or already exists).
  virtual bool
  createDirectory(const std::string& path) = 0;

  /// Create the given directory (recursively) if it does not exist.
  ///
  /// \returns True on success (the directory was created, or already exists).
  virtual bool
  createDirectories(const std::string& path);

  /// Get a memory buffer for a given file on the file system.
  ///
  /// \returns The file contents, on success, or null on error.
  virtual std::unique_ptr<llvm::MemoryBuffer>
  getFileContents(const std::string& path) = 0;

  /// Write \arg contents to the file at \arg path, replacing it if present.
  ///
  /// The parent directory must already exist.
  ///
  /// \returns True on success.
  virtual bool writeFileContents(const std::string& path,
                                 StringRef contents) = 0;

  /// Copy the regular file at \arg from to \arg to, creating the parent
  /// directories of \arg to as needed.
  ///
  /// \returns True on success.
  virtual bool copyFile(const std::string& from, const std::string& to);

  /// List the entries of the directory at \arg path.
  ///
  /// \param recursive If true, descend into subdirectories and report only the
  /// regular files found beneath \arg path; otherwise report every immediate
  /// entry.
  /// \param entries_out [out] The absolute paths of the entries, sorted.
  /// \returns True on success.
  virtual bool listDirectory(const std::string& path, bool recursive,
                             std::vector<std::string>& entries_out) = 0;

  /// Resolve symbolic links and relative components in \arg path.
  ///
  /// \returns The real path, or \arg path unchanged if it cannot be resolved
  /// (for example, because it does not exist yet).
  virtual std::string getRealPath(const std::string& path) = 0;

  /// Remove the file or directory at the given path.
  ///
  /// Directory removal is recursive.
  ///
  /// \returns True if the item was removed, false otherwise.
  virtual bool remove(const std::string& path) = 0;

  /// Get the information to represent the state of the given path in the file
  /// system.
  ///
  /// \returns The FileInfo for the given path, which will be missing if the
  /// path does not exist (or any error was encountered).
  virtual FileInfo getFileInfo(const std::string& path) = 0;

  /// Get the information to represent the state of the given path in the file
  /// system, without looking through symbolic links.
  virtual FileInfo getLinkInfo(const std::string& path) = 0;

  /// Compute the content checksum of the file at \arg path.
  virtual FileChecksum getFileChecksum(const std::string& path) = 0;

  bool exists(const std::string& path) {
    return !getFileInfo(path).isMissing();
  }

  bool isDirectory(const std::string& path) {
    return getFileInfo(path).isDirectory();
  }
};

/// Create a FileSystem instance suitable for accessing the local filesystem.
std::unique_ptr<FileSystem> createLocalFileSystem();

}
}

#endif

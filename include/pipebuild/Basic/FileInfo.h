//===- FileInfo.h -----------------------------------------------*- C++ -*-===//
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
// This file contains the FileInfo wrapper used as the per-file component of a
// target fingerprint.
//
//===----------------------------------------------------------------------===//

#ifndef PIPEBUILD_BASIC_FILEINFO_H
#define PIPEBUILD_BASIC_FILEINFO_H

#include "pipebuild/Basic/BinaryCoding.h"

#include <cstdint>
#include <cstring>
#include <string>

namespace pipebuild {
namespace basic {

/// File timestamp wrapper.
struct FileTimestamp {
  uint64_t seconds;
  uint64_t nanoseconds;

  bool operator==(const FileTimestamp& rhs) const {
    return seconds == rhs.seconds && nanoseconds == rhs.nanoseconds;
  }
  bool operator!=(const FileTimestamp& rhs) const {
    return !(*this == rhs);
  }
  bool operator<(const FileTimestamp& rhs) const {
    return (seconds < rhs.seconds ||
            (seconds == rhs.seconds && nanoseconds < rhs.nanoseconds));
  }
};

/// An MD5 digest of a file's contents.
struct FileChecksum {
  uint8_t bytes[16] = {0};

  bool isNull() const {
    for (auto byte: bytes) {
      if (byte != 0)
        return false;
    }
    return true;
  }

  bool operator==(const FileChecksum& rhs) const {
    return (memcmp(bytes, rhs.bytes, sizeof(bytes)) == 0);
  }

  bool operator!=(const FileChecksum& rhs) const {
    return !(*this==rhs);
  }

  /// Compute the checksum of the file at \arg path.
  ///
  /// \returns The checksum, or a null checksum if the file could not be read.
  static FileChecksum getChecksumForPath(const std::string& path);
};

/// File information which is intended to be used as a proxy for when a file has
/// changed.
struct FileInfo {
  /// The mode flags of the file.
  uint64_t mode = 0;
  /// The size of the file.
  uint64_t size = 0;
  /// The modification time of the file.
  FileTimestamp modTime = {0, 0};
  /// The checksum of the file, if it has been computed.
  FileChecksum checksum = {};

  /// Check if this is a FileInfo representing a missing file.
  bool isMissing() const {
    // We use an all-zero FileInfo as a sentinel, under the assumption this can
    // never exist in normal circumstances.
    return (mode == 0 && size == 0 &&
            modTime.seconds == 0 && modTime.nanoseconds == 0);
  }

  /// Check if the FileInfo corresponds to a directory.
  bool isDirectory() const;

  /// Check if the FileInfo corresponds to a regular file.
  bool isRegularFile() const;

  /// Check whether \arg current describes the same file contents as this
  /// (previously recorded) information.
  ///
  /// The size must match; then either the modification time matches, or the
  /// content checksums are equal. The checksum comparison lets a file that was
  /// touched but not modified still count as unchanged.
  bool isUpToDate(const FileInfo& current) const;

  bool operator==(const FileInfo& rhs) const {
    return (mode == rhs.mode &&
            size == rhs.size &&
            modTime == rhs.modTime &&
            checksum == rhs.checksum);
  }

  bool operator!=(const FileInfo& rhs) const {
    return !(*this == rhs);
  }

  /// Get the information to represent the state of the given node in the file
  /// system.
  ///
  /// \param asLink If yes, checks the information for the file path without
  /// looking through symbolic links.
  ///
  /// \returns The FileInfo for the given path, which will be missing if the
  /// path does not exist (or any error was encountered). The checksum is not
  /// computed.
  static FileInfo getInfoForPath(const std::string& path, bool asLink = false);
};

template<>
struct BinaryCodingTraits<FileTimestamp> {
  static inline void encode(const FileTimestamp& value, BinaryEncoder& coder) {
    coder.write(value.seconds);
    coder.write(value.nanoseconds);
  }
  static inline void decode(FileTimestamp& value, BinaryDecoder& coder) {
    coder.read(value.seconds);
    coder.read(value.nanoseconds);
  }
};

template<>
struct BinaryCodingTraits<FileChecksum> {
  static inline void encode(const FileChecksum& value, BinaryEncoder& coder) {
    for (int i = 0; i != 16; ++i) {
      coder.write(value.bytes[i]);
    }
  }
  static inline void decode(FileChecksum& value, BinaryDecoder& coder) {
    for (int i = 0; i != 16; ++i) {
      coder.read(value.bytes[i]);
    }
  }
};

template<>
struct BinaryCodingTraits<FileInfo> {
  static inline void encode(const FileInfo& value, BinaryEncoder& coder) {
    coder.write(value.mode);
    coder.write(value.size);
    coder.write(value.modTime);
    coder.write(value.checksum);
  }
  static inline void decode(FileInfo& value, BinaryDecoder& coder) {
    coder.read(value.mode);
    coder.read(value.size);
    coder.read(value.modTime);
    coder.read(value.checksum);
  }
};

}
}

#endif

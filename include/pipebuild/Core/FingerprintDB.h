//===- FingerprintDB.h ------------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_CORE_FINGERPRINTDB_H
#define PIPEBUILD_CORE_FINGERPRINTDB_H

#include "pipebuild/Basic/BinaryCoding.h"
#include "pipebuild/Basic/FileInfo.h"
#include "pipebuild/Basic/Hashing.h"
#include "pipebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pipebuild {
namespace core {

/// The recorded state of one file.
struct FileFingerprint {
  std::string path;
  basic::FileInfo info;

  bool operator==(const FileFingerprint& rhs) const {
    return path == rhs.path && info == rhs.info;
  }
};

/// The state of a target as of its last successful build.
struct TargetFingerprint {
  /// The signature of the target's declaration.
  basic::Signature signature;

  /// The resolved input files, including depfile-discovered inputs.
  std::vector<FileFingerprint> inputs;

  /// The resolved output files, including depfile-discovered outputs.
  std::vector<FileFingerprint> outputs;

  /// The depfiles the target declared, all of which existed when the record was
  /// made.
  std::vector<std::string> depfiles;
};

class FingerprintDB {
public:
  virtual ~FingerprintDB();

  /// Look up the stored fingerprint for a target.
  ///
  /// \param name The target name.
  /// \param result_out [out] The fingerprint, if found.
  /// \param error_out [out] Error string if an error occurred.
  /// \returns True if the database had a stored fingerprint for the target.
  virtual bool lookupFingerprint(StringRef name, TargetFingerprint* result_out,
                                 std::string* error_out) = 0;

  /// Update the stored fingerprint for a target.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool setFingerprint(StringRef name, const TargetFingerprint& value,
                              std::string* error_out) = 0;

  /// Remove any stored fingerprint for a target, so that it is rebuilt.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool removeFingerprint(StringRef name, std::string* error_out) = 0;

  /// Called by the build system to indicate that a build has started.
  ///
  /// All mutation operations are only called between paired \see
  /// buildStarted() and \see buildComplete() calls.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool buildStarted(std::string* error_out) = 0;

  /// Called by the build system to indicate a build has finished, and results
  /// should be written.
  virtual void buildComplete() = 0;

  /// Get the names of all targets with a stored fingerprint.
  ///
  /// \param names_out [out] The names will be appended to this vector.
  /// \param error_out [out] Error string if return value is false.
  virtual bool getTargetNames(std::vector<std::string>& names_out,
                              std::string* error_out) = 0;
};

/// Create a FingerprintDB instance backed by a SQLite3 database.
///
/// \param clientSchemaVersion An uninterpreted version number for use by the
/// client to allow batch changes to the stored fingerprints; if the stored
/// schema does not match the provided version the database will be cleared upon
/// opening.
std::unique_ptr<FingerprintDB> createSQLiteFingerprintDB(
    StringRef path, uint32_t clientSchemaVersion, std::string* error_out);

/// Create a FingerprintDB instance which only lives as long as the process.
std::unique_ptr<FingerprintDB> createInMemoryFingerprintDB();

}

namespace basic {

template<>
struct BinaryCodingTraits<core::FileFingerprint> {
  static inline void encode(const core::FileFingerprint& value,
                            BinaryEncoder& coder) {
    coder.writeString(value.path);
    coder.write(value.info);
  }
  static inline void decode(core::FileFingerprint& value,
                            BinaryDecoder& coder) {
    coder.readString(value.path);
    coder.read(value.info);
  }
};

template<>
struct BinaryCodingTraits<core::TargetFingerprint> {
  static inline void encode(const core::TargetFingerprint& value,
                            BinaryEncoder& coder) {
    coder.write(value.signature);
    coder.write(uint32_t(value.inputs.size()));
    for (const auto& input: value.inputs)
      coder.write(input);
    coder.write(uint32_t(value.outputs.size()));
    for (const auto& output: value.outputs)
      coder.write(output);
    coder.write(uint32_t(value.depfiles.size()));
    for (const auto& depfile: value.depfiles)
      coder.writeString(depfile);
  }
  static inline void decode(core::TargetFingerprint& value,
                            BinaryDecoder& coder) {
    coder.read(value.signature);
    uint32_t count;
    coder.read(count);
    for (uint32_t i = 0; i != count && !coder.hasFailed(); ++i) {
      core::FileFingerprint input;
      coder.read(input);
      value.inputs.push_back(std::move(input));
    }
    coder.read(count);
    for (uint32_t i = 0; i != count && !coder.hasFailed(); ++i) {
      core::FileFingerprint output;
      coder.read(output);
      value.outputs.push_back(std::move(output));
    }
    coder.read(count);
    for (uint32_t i = 0; i != count && !coder.hasFailed(); ++i) {
      std::string depfile;
      coder.readString(depfile);
      value.depfiles.push_back(std::move(depfile));
    }
  }
};

}
}

#endif

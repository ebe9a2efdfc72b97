//===- Depfile.h ------------------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_CORE_DEPFILE_H
#define PIPEBUILD_CORE_DEPFILE_H

#include "pipebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace pipebuild {
namespace basic {
  class FileSystem;
}

namespace core {

/// Error produced when depfile text is malformed.
class DepfileParseError : public llvm::ErrorInfo<DepfileParseError> {
public:
  static char ID;

  DepfileParseError(StringRef path, StringRef message, uint64_t position)
    : path(path.str()), message(message.str()), position(position) {}

  const std::string& getPath() const { return path; }
  const std::string& getMessage() const { return message; }
  uint64_t getPosition() const { return position; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;

private:
  std::string path;
  std::string message;
  uint64_t position;
};

/// The files an action consumed and produced, as recorded in Make rule form.
class Depfile {
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;

public:
  Depfile() {}
  Depfile(std::vector<std::string> inputs, std::vector<std::string> outputs)
    : inputs(std::move(inputs)), outputs(std::move(outputs)) {}

  const std::vector<std::string>& getInputs() const { return inputs; }
  const std::vector<std::string>& getOutputs() const { return outputs; }

  void addInput(StringRef path) { inputs.push_back(path.str()); }
  void addOutput(StringRef path) { outputs.push_back(path.str()); }

  bool operator==(const Depfile& rhs) const {
    return inputs == rhs.inputs && outputs == rhs.outputs;
  }
  bool operator!=(const Depfile& rhs) const { return !(*this == rhs); }

  /// Encode as "out1 out2: in1 in2", escaping spaces, tabs, colons and
  /// backslashes.
  ///
  /// Paths containing line breaks cannot be represented; \see writeToFile()
  /// rejects them.
  std::string toString() const;

  /// Decode depfile text.
  ///
  /// Each side is deduplicated, keeping the first occurrence of a path.
  ///
  /// \param path The file the text came from, for diagnostics.
  static llvm::Expected<Depfile> parse(StringRef text, StringRef path = "");

  /// Read and decode the depfile at \arg path.
  static llvm::Expected<Depfile> readFromFile(basic::FileSystem& fileSystem,
                                             const std::string& path);

  /// Encode and write this depfile to \arg path, creating its parent
  /// directory if needed.
  ///
  /// \returns An error if a path contains a line break, or on I/O failure.
  llvm::Error writeToFile(basic::FileSystem& fileSystem,
                          const std::string& path) const;
};

/// Escape \arg path for use as a depfile word.
std::string escapeDepfilePath(StringRef path);

}
}

#endif

//===- BuildSystemErrors.h --------------------------------------*- C++ -*-===//
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
// Typed errors reported by source resolution, graph validation and build
// actions.
//
//===----------------------------------------------------------------------===//

#ifndef PIPEBUILD_BUILDSYSTEM_BUILDSYSTEMERRORS_H
#define PIPEBUILD_BUILDSYSTEM_BUILDSYSTEMERRORS_H

#include "pipebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <utility>
#include <vector>

namespace pipebuild {
namespace buildsystem {

/// A pattern source with an unknown root token or a misplaced wildcard.
class InvalidPatternError : public llvm::ErrorInfo<InvalidPatternError> {
  std::string pattern;
  std::string reason;

public:
  static char ID;

  InvalidPatternError(StringRef pattern, StringRef reason)
    : pattern(pattern.str()), reason(reason.str()) {}

  const std::string& getPattern() const { return pattern; }
  const std::string& getReason() const { return reason; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;
};

/// A required, explicitly named input which does not exist.
class MissingInputError : public llvm::ErrorInfo<MissingInputError> {
  std::string path;
  std::string pattern;

public:
  static char ID;

  MissingInputError(StringRef path, StringRef pattern)
    : path(path.str()), pattern(pattern.str()) {}

  const std::string& getPath() const { return path; }
  const std::string& getPattern() const { return pattern; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;
};

/// A cycle in the target dependency graph.
class CycleError : public llvm::ErrorInfo<CycleError> {
  std::vector<std::string> cycle;

public:
  static char ID;

  /// \param cycle The target names along the cycle, with the first name
  /// repeated at the end.
  explicit CycleError(std::vector<std::string> cycle)
    : cycle(std::move(cycle)) {}

  const std::vector<std::string>& getCycle() const { return cycle; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;
};

/// Two distinct targets in one graph with the same name.
class DuplicateTargetError : public llvm::ErrorInfo<DuplicateTargetError> {
  std::string name;

public:
  static char ID;

  explicit DuplicateTargetError(StringRef name) : name(name.str()) {}

  const std::string& getName() const { return name; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;
};

/// One or more asset copies failed.
class AssetCopyError : public llvm::ErrorInfo<AssetCopyError> {
public:
  struct Failure {
    /// The output-relative path of the entry.
    std::string path;
    std::string message;
  };

private:
  std::vector<Failure> failures;

public:
  static char ID;

  explicit AssetCopyError(std::vector<Failure> failures)
    : failures(std::move(failures)) {}

  const std::vector<Failure>& getFailures() const { return failures; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;
};

/// A target action or its post-build verification failed.
class TargetFailedError : public llvm::ErrorInfo<TargetFailedError> {
  std::string target;
  std::string message;

public:
  static char ID;

  TargetFailedError(StringRef target, StringRef message)
    : target(target.str()), message(message.str()) {}

  const std::string& getTarget() const { return target; }
  const std::string& getMessage() const { return message; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;
};

}
}

#endif

//===-- BuildSystemErrors.cpp ---------------------------------------------===//
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

#include "pipebuild/BuildSystem/BuildSystemErrors.h"

#include "llvm/Support/raw_ostream.h"

using namespace pipebuild;
using namespace pipebuild::buildsystem;

char InvalidPatternError::ID = 0;
char MissingInputError::ID = 0;
char CycleError::ID = 0;
char DuplicateTargetError::ID = 0;
char AssetCopyError::ID = 0;
char TargetFailedError::ID = 0;

void InvalidPatternError::log(raw_ostream& os) const {
  os << "invalid pattern '" << pattern << "': " << reason;
}

std::error_code InvalidPatternError::convertToErrorCode() const {
  return std::make_error_code(std::errc::invalid_argument);
}

void MissingInputError::log(raw_ostream& os) const {
  os << "missing input '" << path << "' (from '" << pattern << "')";
}

std::error_code MissingInputError::convertToErrorCode() const {
  return std::make_error_code(std::errc::no_such_file_or_directory);
}

void CycleError::log(raw_ostream& os) const {
  os << "cycle detected among targets: ";
  bool first = true;
  for (const auto& name: cycle) {
    if (!first)
      os << " -> ";
    first = false;
    os << name;
  }
}

std::error_code CycleError::convertToErrorCode() const {
  return std::make_error_code(std::errc::invalid_argument);
}

void DuplicateTargetError::log(raw_ostream& os) const {
  os << "duplicate target name '" << name << "'";
}

std::error_code DuplicateTargetError::convertToErrorCode() const {
  return std::make_error_code(std::errc::invalid_argument);
}

void AssetCopyError::log(raw_ostream& os) const {
  os << "failed to copy " << failures.size()
     << (failures.size() == 1 ? " asset:" : " assets:");
  for (const auto& failure: failures) {
    os << "\n  " << failure.path << ": " << failure.message;
  }
}

std::error_code AssetCopyError::convertToErrorCode() const {
  return std::make_error_code(std::errc::io_error);
}

void TargetFailedError::log(raw_ostream& os) const {
  os << "target '" << target << "' failed: " << message;
}

std::error_code TargetFailedError::convertToErrorCode() const {
  return std::make_error_code(std::errc::io_error);
}

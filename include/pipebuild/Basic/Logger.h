//===- Logger.h -------------------------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2025 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#ifndef PIPEBUILD_BASIC_LOGGER_H
#define PIPEBUILD_BASIC_LOGGER_H

#include "pipebuild/Basic/Compiler.h"
#include "pipebuild/Basic/LLVM.h"

#include <memory>

namespace pipebuild {
namespace basic {

/// Leveled diagnostics sink.
///
/// Implementations must be thread-safe; messages arrive from any lane.
class Logger {
  // DO NOT COPY
  Logger(const Logger&) PIPEBUILD_DELETED_FUNCTION;
  void operator=(const Logger&) PIPEBUILD_DELETED_FUNCTION;

public:
  Logger() {}
  virtual ~Logger();

  virtual void error(const Twine& message) = 0;
  virtual void warning(const Twine& message) = 0;
  virtual void note(const Twine& message) = 0;

  /// Report a message only shown in verbose mode.
  virtual void verbose(const Twine& message) = 0;
};

class NullLogger : public Logger {
public:
  NullLogger() {}
  ~NullLogger();

  void error(const Twine&) override;
  void warning(const Twine&) override;
  void note(const Twine&) override;
  void verbose(const Twine&) override;
};

/// Create a logger which writes "error: ...", "warning: ..." and "note: ..."
/// lines to \arg os.
///
/// \param verbose Whether verbose messages are printed.
std::unique_ptr<Logger> createStreamLogger(raw_ostream& os,
                                           bool verbose = false);

}
}

#endif

//===-- Logger.cpp --------------------------------------------------------===//
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

#include "pipebuild/Basic/Logger.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"

#include <mutex>

using namespace pipebuild;
using namespace pipebuild::basic;

Logger::~Logger() {}

NullLogger::~NullLogger() {}
void NullLogger::error(const Twine&) {}
void NullLogger::warning(const Twine&) {}
void NullLogger::note(const Twine&) {}
void NullLogger::verbose(const Twine&) {}

namespace {

class StreamLogger : public Logger {
  raw_ostream& os;
  bool showVerbose;
  std::mutex outputMutex;

  void emit(StringRef kind, const Twine& message) {
    std::lock_guard<std::mutex> guard(outputMutex);
    if (!kind.empty())
      os << kind << ": ";
    os << message << "\n";
    os.flush();
  }

public:
  StreamLogger(raw_ostream& os, bool showVerbose)
    : os(os), showVerbose(showVerbose) {}

  void error(const Twine& message) override { emit("error", message); }
  void warning(const Twine& message) override { emit("warning", message); }
  void note(const Twine& message) override { emit("note", message); }

  void verbose(const Twine& message) override {
    if (showVerbose)
      emit("", message);
  }
};

}

std::unique_ptr<Logger> basic::createStreamLogger(raw_ostream& os,
                                                  bool verbose) {
  return std::make_unique<StreamLogger>(os, verbose);
}

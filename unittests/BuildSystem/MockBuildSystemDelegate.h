//===- MockBuildSystemDelegate.h --------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2017 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#ifndef PIPEBUILD_UNITTESTS_MOCKBUILDSYSTEMDELEGATE_H
#define PIPEBUILD_UNITTESTS_MOCKBUILDSYSTEMDELEGATE_H

#include "pipebuild/BuildSystem/BuildSystem.h"
#include "pipebuild/BuildSystem/Target.h"

#include "pipebuild/Basic/LLVM.h"
#include "pipebuild/Basic/Logger.h"

#include "llvm/ADT/Twine.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pipebuild {
namespace unittests {

/// A logger which records every message, prefixed by its level.
class MockLogger : public basic::Logger {
  std::vector<std::string> messages;
  std::mutex messagesMutex;

  void add(StringRef level, const Twine& message) {
    std::lock_guard<std::mutex> lock(messagesMutex);
    messages.push_back((level + ": " + message).str());
  }

public:
  std::vector<std::string> getMessages() {
    std::lock_guard<std::mutex> lock(messagesMutex);
    return messages;
  }

  /// Get the recorded messages of one level, without the prefix.
  std::vector<std::string> getMessages(StringRef level) {
    std::lock_guard<std::mutex> lock(messagesMutex);
    std::vector<std::string> result;
    std::string prefix = level.str() + ": ";
    for (const auto& message: messages) {
      if (StringRef(message).startswith(prefix))
        result.push_back(message.substr(prefix.size()));
    }
    return result;
  }

  void error(const Twine& message) override { add("error", message); }
  void warning(const Twine& message) override { add("warning", message); }
  void note(const Twine& message) override { add("note", message); }
  void verbose(const Twine& message) override { add("verbose", message); }
};

/// A build system delegate which records the status of each target as
/// "started: <name>", "skipped: <name>", "finished: <name>" or
/// "failed: <name>: <message>".
class MockBuildSystemDelegate : public buildsystem::BuildSystemDelegate {
  std::vector<std::string> messages;
  std::mutex messagesMutex;

  void add(const Twine& message) {
    std::lock_guard<std::mutex> lock(messagesMutex);
    messages.push_back(message.str());
  }

public:
  std::vector<std::string> getMessages() {
    std::lock_guard<std::mutex> lock(messagesMutex);
    return messages;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(messagesMutex);
    messages.clear();
  }

  void targetStarted(const buildsystem::Target& target) override {
    add("started: " + target.getName());
  }

  void targetSkipped(const buildsystem::Target& target) override {
    add("skipped: " + target.getName());
  }

  void targetFinished(const buildsystem::Target& target) override {
    add("finished: " + target.getName());
  }

  void targetFailed(const buildsystem::Target& target,
                    StringRef message) override {
    add(Twine("failed: ") + target.getName() + ": " + message);
  }
};

}
}

#endif

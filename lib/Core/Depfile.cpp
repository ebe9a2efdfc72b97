//===-- Depfile.cpp -------------------------------------------------------===//
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

#include "pipebuild/Core/Depfile.h"

#include "pipebuild/Basic/FileSystem.h"
#include "pipebuild/Core/DepfileParser.h"

#include "llvm/ADT/StringSet.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

using namespace pipebuild;
using namespace pipebuild::core;

char DepfileParseError::ID = 0;

void DepfileParseError::log(raw_ostream& os) const {
  os << "invalid depfile";
  if (!path.empty())
    os << " '" << path << "'";
  os << ": " << message << " (at offset " << position << ")";
}

std::error_code DepfileParseError::convertToErrorCode() const {
  return std::make_error_code(std::errc::invalid_argument);
}

std::string core::escapeDepfilePath(StringRef path) {
  std::string result;
  result.reserve(path.size());
  for (char c: path) {
    if (c == ' ' || c == '\t' || c == ':' || c == '\\')
      result.push_back('\\');
    result.push_back(c);
  }
  return result;
}

static void formatFiles(raw_ostream& os, const std::vector<std::string>& files) {
  bool first = true;
  for (const auto& file: files) {
    if (!first)
      os << ' ';
    first = false;
    os << escapeDepfilePath(file);
  }
}

std::string Depfile::toString() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  formatFiles(os, outputs);
  os << ": ";
  formatFiles(os, inputs);
  os.flush();
  return result;
}

namespace {

class CollectingActions : public DepfileParser::ParseActions {
  llvm::StringSet<> seenInputs;
  llvm::StringSet<> seenOutputs;

public:
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;
  std::string errorMessage;
  uint64_t errorPosition = 0;
  bool hadError = false;

  void error(StringRef message, uint64_t position) override {
    hadError = true;
    errorMessage = message.str();
    errorPosition = position;
  }

  void actOnOutput(StringRef word) override {
    if (seenOutputs.insert(word).second)
      outputs.push_back(word.str());
  }

  void actOnInput(StringRef word) override {
    if (seenInputs.insert(word).second)
      inputs.push_back(word.str());
  }
};

}

llvm::Expected<Depfile> Depfile::parse(StringRef text, StringRef path) {
  CollectingActions actions;
  DepfileParser(text, actions).parse();
  if (actions.hadError) {
    return llvm::make_error<DepfileParseError>(path, actions.errorMessage,
                                               actions.errorPosition);
  }
  return Depfile(std::move(actions.inputs), std::move(actions.outputs));
}

llvm::Expected<Depfile> Depfile::readFromFile(basic::FileSystem& fileSystem,
                                              const std::string& path) {
  auto contents = fileSystem.getFileContents(path);
  if (!contents) {
    return llvm::createStringError(
        std::make_error_code(std::errc::no_such_file_or_directory),
        "unable to read depfile '%s'", path.c_str());
  }
  return parse(contents->getBuffer(), path);
}

static bool hasLineBreak(const std::vector<std::string>& files,
                         std::string& file_out) {
  for (const auto& file: files) {
    if (StringRef(file).find_first_of("\r\n") != StringRef::npos) {
      file_out = file;
      return true;
    }
  }
  return false;
}

llvm::Error Depfile::writeToFile(basic::FileSystem& fileSystem,
                                 const std::string& path) const {
  // A backslash before a line break is a line continuation, so such paths
  // have no encoding.
  std::string file;
  if (hasLineBreak(outputs, file) || hasLineBreak(inputs, file)) {
    return llvm::createStringError(
        std::make_error_code(std::errc::invalid_argument),
        "unable to write depfile '%s': path contains a line break: '%s'",
        path.c_str(), file.c_str());
  }
  StringRef parent = llvm::sys::path::parent_path(path);
  if (!parent.empty() && !fileSystem.createDirectories(parent.str())) {
    return llvm::createStringError(
        std::make_error_code(std::errc::io_error),
        "unable to create directory '%s'", parent.str().c_str());
  }
  if (!fileSystem.writeFileContents(path, toString())) {
    return llvm::createStringError(
        std::make_error_code(std::errc::io_error),
        "unable to write depfile '%s'", path.c_str());
  }
  return llvm::Error::success();
}

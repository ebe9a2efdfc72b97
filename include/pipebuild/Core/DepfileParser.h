//===- DepfileParser.h ------------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_CORE_DEPFILEPARSER_H
#define PIPEBUILD_CORE_DEPFILEPARSER_H

#include "pipebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>

namespace pipebuild {
namespace core {

/// Parser for the single-rule Make syntax used by depfiles:
///
///   out1 out2: in1 in2
///
/// The rule separator is the first unescaped ':' followed by whitespace (or the
/// end of input), so that drive-letter colons inside paths are not separators.
/// Words are separated by unescaped spaces, tabs, newlines and backslash-newline
/// continuations; "\<char>" decodes to "<char>".
class DepfileParser {
public:
  /// Delegate interface for parser behavior.
  struct ParseActions {
    virtual ~ParseActions();

    /// Called if an error is encountered in parsing the input.
    ///
    /// \param message A message including information on the error.
    ///
    /// \param position The approximate position of the error in the input
    /// buffer.
    virtual void error(StringRef message, uint64_t position) = 0;

    /// Called for each word on the left hand side of the separator.
    ///
    /// \param unescapedWord - An unescaped version of the word.
    virtual void actOnOutput(StringRef unescapedWord) = 0;

    /// Called for each word on the right hand side of the separator.
    ///
    /// \param unescapedWord - An unescaped version of the word.
    virtual void actOnInput(StringRef unescapedWord) = 0;
  };

private:
  StringRef data;
  ParseActions& actions;

public:
  DepfileParser(StringRef data, ParseActions& actions)
    : data(data), actions(actions) {}

  /// Parse the input, reporting words and errors to the actions.
  ///
  /// Parsing stops at the first error.
  ///
  /// \returns True if no error was reported.
  bool parse();
};

}
}

#endif

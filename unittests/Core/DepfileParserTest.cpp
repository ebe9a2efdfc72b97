//===- unittests/Core/DepfileParserTest.cpp -------------------------------===//
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

#include "pipebuild/Core/DepfileParser.h"

#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace pipebuild;
using namespace pipebuild::core;

namespace {

TEST(DepfileParserTest, basic) {
  typedef std::pair<std::string, uint64_t> ErrorRecord;
  struct TestActions : public DepfileParser::ParseActions {
    std::vector<std::string> outputs;
    std::vector<std::string> inputs;
    std::vector<ErrorRecord> errors;

    virtual void error(StringRef message, uint64_t position) override {
      errors.push_back({ message.str(), position });
    }

    virtual void actOnOutput(StringRef unescapedWord) override {
      outputs.push_back(unescapedWord.str());
    }

    virtual void actOnInput(StringRef unescapedWord) override {
      inputs.push_back(unescapedWord.str());
    }

    void clear() {
      outputs.clear();
      inputs.clear();
      errors.clear();
    }
  };

  TestActions actions;
  std::string input;

  // Check a basic valid input.
  input = "a b: c d";
  EXPECT_TRUE(DepfileParser(input, actions).parse());
  EXPECT_EQ(0U, actions.errors.size());
  EXPECT_EQ(std::vector<std::string>({ "a", "b" }), actions.outputs);
  EXPECT_EQ(std::vector<std::string>({ "c", "d" }), actions.inputs);

  // Check escaped spaces and backslashes.
  actions.clear();
  input = "out\\ dir/a: in\\ dir/b c\\\\d";
  EXPECT_TRUE(DepfileParser(input, actions).parse());
  EXPECT_EQ(0U, actions.errors.size());
  EXPECT_EQ(std::vector<std::string>({ "out dir/a" }), actions.outputs);
  EXPECT_EQ(std::vector<std::string>({ "in dir/b", "c\\d" }), actions.inputs);

  // Check line continuations, tabs and trailing newlines, as emitted by
  // compilers.
  actions.clear();
  input = "a.o: a.c \\\n  a.h\t\\\r\n  b.h\n";
  EXPECT_TRUE(DepfileParser(input, actions).parse());
  EXPECT_EQ(0U, actions.errors.size());
  EXPECT_EQ(std::vector<std::string>({ "a.o" }), actions.outputs);
  EXPECT_EQ(std::vector<std::string>({ "a.c", "a.h", "b.h" }), actions.inputs);

  // Check that a colon inside a word is not a separator.
  actions.clear();
  input = "C:/out.txt: C:/in.txt";
  EXPECT_TRUE(DepfileParser(input, actions).parse());
  EXPECT_EQ(0U, actions.errors.size());
  EXPECT_EQ(std::vector<std::string>({ "C:/out.txt" }), actions.outputs);
  EXPECT_EQ(std::vector<std::string>({ "C:/in.txt" }), actions.inputs);

  // Check a rule with no inputs.
  actions.clear();
  input = "a b:";
  EXPECT_TRUE(DepfileParser(input, actions).parse());
  EXPECT_EQ(std::vector<std::string>({ "a", "b" }), actions.outputs);
  EXPECT_EQ(0U, actions.inputs.size());

  // Check a missing separator.
  actions.clear();
  input = "a b c";
  EXPECT_FALSE(DepfileParser(input, actions).parse());
  ASSERT_EQ(1U, actions.errors.size());
  EXPECT_EQ(ErrorRecord("missing ': ' separator in depfile", 5),
            actions.errors[0]);

  // Check multiple separators.
  actions.clear();
  input = "a: b: c";
  EXPECT_FALSE(DepfileParser(input, actions).parse());
  ASSERT_EQ(1U, actions.errors.size());
  EXPECT_EQ(ErrorRecord("multiple ': ' separators in depfile", 4),
            actions.errors[0]);
  EXPECT_EQ(std::vector<std::string>({ "b" }), actions.inputs);
}

}

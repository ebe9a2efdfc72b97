//===- unittests/Core/DepfileTest.cpp -------------------------------------===//
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

#include "../BuildSystem/TempDir.h"

#include "pipebuild/Basic/FileSystem.h"

#include "llvm/Support/Error.h"

#include "gtest/gtest.h"

using namespace pipebuild;
using namespace pipebuild::core;

namespace {

TEST(DepfileTest, encode) {
  Depfile depfile({ "/in/a.txt", "/in/with space.txt" }, { "/out/b.txt" });
  EXPECT_EQ("/out/b.txt: /in/a.txt /in/with\\ space.txt", depfile.toString());

  Depfile noInputs({}, { "/out/b.txt" });
  EXPECT_EQ("/out/b.txt: ", noInputs.toString());

  EXPECT_EQ("a\\\\b\\ c", escapeDepfilePath("a\\b c"));
}

TEST(DepfileTest, roundTripWithEscapedSpace) {
  Depfile depfile({ "a b" }, { "c" });
  auto text = depfile.toString();
  EXPECT_EQ("c: a\\ b", text);

  auto decoded = Depfile::parse(text);
  ASSERT_TRUE(bool(decoded)) << llvm::toString(decoded.takeError());
  EXPECT_EQ(depfile, *decoded);
  EXPECT_EQ(std::vector<std::string>({ "a b" }), decoded->getInputs());
}

TEST(DepfileTest, roundTripWithTabsAndColons) {
  Depfile depfile({ "tab\there", "C:\\dir", "ends:" }, { "out:" });
  auto text = depfile.toString();
  EXPECT_EQ("out\\:: tab\\\there C\\:\\\\dir ends\\:", text);

  auto decoded = Depfile::parse(text);
  ASSERT_TRUE(bool(decoded)) << llvm::toString(decoded.takeError());
  EXPECT_EQ(depfile, *decoded);
}

TEST(DepfileTest, parseDeduplicates) {
  auto decoded = Depfile::parse("o o: a b a");
  ASSERT_TRUE(bool(decoded)) << llvm::toString(decoded.takeError());
  EXPECT_EQ(std::vector<std::string>({ "o" }), decoded->getOutputs());
  EXPECT_EQ(std::vector<std::string>({ "a", "b" }), decoded->getInputs());
}

TEST(DepfileTest, parseErrors) {
  auto decoded = Depfile::parse("no separator here", "/build/x.d");
  ASSERT_FALSE(bool(decoded));
  std::string message;
  llvm::handleAllErrors(decoded.takeError(),
                        [&](const DepfileParseError& error) {
    EXPECT_EQ("/build/x.d", error.getPath());
    message = error.getMessage();
  });
  EXPECT_EQ("missing ': ' separator in depfile", message);

  auto multiple = Depfile::parse("a: b: c");
  ASSERT_FALSE(bool(multiple));
  EXPECT_EQ("invalid depfile: multiple ': ' separators in depfile "
            "(at offset 4)", llvm::toString(multiple.takeError()));
}

TEST(DepfileTest, readAndWrite) {
  TmpDir tempDir(__func__);
  auto fs = basic::createLocalFileSystem();

  // Writing creates the parent directory.
  std::string path = tempDir.path("nested/dir/out.d");
  Depfile depfile({ tempDir.path("in 1.txt") }, { tempDir.path("out.txt") });
  ASSERT_FALSE(llvm::errorToBool(depfile.writeToFile(*fs, path)));

  auto read = Depfile::readFromFile(*fs, path);
  ASSERT_TRUE(bool(read)) << llvm::toString(read.takeError());
  EXPECT_EQ(depfile, *read);

  // Line breaks cannot be escaped, so writing them is rejected.
  std::string brokenPath = tempDir.path("broken.d");
  Depfile broken({ "line\nbreak" }, { "out" });
  auto error = broken.writeToFile(*fs, brokenPath);
  ASSERT_TRUE(bool(error));
  EXPECT_EQ(std::make_error_code(std::errc::invalid_argument),
            llvm::errorToErrorCode(std::move(error)));
  EXPECT_FALSE(fs->exists(brokenPath));

  Depfile carriageReturn({ "in" }, { "out\r" });
  EXPECT_TRUE(llvm::errorToBool(carriageReturn.writeToFile(*fs, brokenPath)));
  EXPECT_FALSE(fs->exists(brokenPath));

  auto missing = Depfile::readFromFile(*fs, tempDir.path("missing.d"));
  ASSERT_FALSE(bool(missing));
  EXPECT_EQ(std::make_error_code(std::errc::no_such_file_or_directory),
            llvm::errorToErrorCode(missing.takeError()));
}

}

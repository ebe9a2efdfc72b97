//===- unittests/Core/SQLiteFingerprintDBTest.cpp -------------------------===//
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

#include "pipebuild/Core/FingerprintDB.h"

#include "pipebuild/Basic/BinaryCoding.h"

#include "../BuildSystem/TempDir.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"

#include "gtest/gtest.h"

#include <sqlite3.h>

#include <sstream>

using namespace pipebuild;
using namespace pipebuild::core;

namespace {

static TargetFingerprint makeFingerprint(StringRef name) {
  TargetFingerprint value;
  value.signature = basic::Signature(name);

  FileFingerprint input;
  input.path = "/project/" + name.str() + ".in";
  input.info.mode = 0100644;
  input.info.size = 42;
  input.info.modTime = { 1700000000, 123 };
  input.info.checksum.bytes[3] = 0xAB;
  value.inputs.push_back(input);

  FileFingerprint output;
  output.path = "/build/" + name.str() + ".out";
  output.info.mode = 0100644;
  output.info.size = 7;
  output.info.modTime = { 1700000001, 0 };
  value.outputs.push_back(output);

  value.depfiles.push_back(name.str() + ".d");
  return value;
}

TEST(SQLiteFingerprintDBTest, storeAndLookup) {
  TmpDir tempDir(__func__);
  std::string path = tempDir.path("build.db");

  std::string error;
  auto db = createSQLiteFingerprintDB(path, 1, &error);
  ASSERT_TRUE(db != nullptr) << error;

  TargetFingerprint result;
  ASSERT_TRUE(db->buildStarted(&error)) << error;
  EXPECT_FALSE(db->lookupFingerprint("a", &result, &error));
  EXPECT_EQ("", error);

  auto a = makeFingerprint("a");
  auto b = makeFingerprint("b");
  EXPECT_TRUE(db->setFingerprint("a", a, &error)) << error;
  EXPECT_TRUE(db->setFingerprint("b", b, &error)) << error;
  db->buildComplete();

  // Reopen the database, and check the records persisted.
  db = createSQLiteFingerprintDB(path, 1, &error);
  ASSERT_TRUE(db != nullptr) << error;
  ASSERT_TRUE(db->lookupFingerprint("a", &result, &error)) << error;
  EXPECT_EQ(a.signature, result.signature);
  ASSERT_EQ(1U, result.inputs.size());
  EXPECT_EQ(a.inputs[0], result.inputs[0]);
  ASSERT_EQ(1U, result.outputs.size());
  EXPECT_EQ(a.outputs[0], result.outputs[0]);
  EXPECT_EQ(std::vector<std::string>({ "a.d" }), result.depfiles);

  std::vector<std::string> names;
  ASSERT_TRUE(db->getTargetNames(names, &error)) << error;
  EXPECT_EQ(std::vector<std::string>({ "a", "b" }), names);

  // Check removal.
  ASSERT_TRUE(db->buildStarted(&error)) << error;
  EXPECT_TRUE(db->removeFingerprint("a", &error)) << error;
  EXPECT_FALSE(db->lookupFingerprint("a", &result, &error));
  EXPECT_EQ("", error);
  db->buildComplete();
}

TEST(SQLiteFingerprintDBTest, clientVersionChangeDiscardsRecords) {
  TmpDir tempDir(__func__);
  std::string path = tempDir.path("build.db");

  std::string error;
  auto db = createSQLiteFingerprintDB(path, 1, &error);
  ASSERT_TRUE(db != nullptr) << error;
  ASSERT_TRUE(db->buildStarted(&error)) << error;
  EXPECT_TRUE(db->setFingerprint("a", makeFingerprint("a"), &error)) << error;
  db->buildComplete();

  db = createSQLiteFingerprintDB(path, 2, &error);
  ASSERT_TRUE(db != nullptr) << error;
  TargetFingerprint result;
  EXPECT_FALSE(db->lookupFingerprint("a", &result, &error));
  EXPECT_EQ("", error);
}

TEST(SQLiteFingerprintDBTest, ErrorHandling) {
  TmpDir tempDir(__func__);
  std::string path = tempDir.path("build.db");

  std::string error;
  auto fingerprintDB = createSQLiteFingerprintDB(path, 1, &error);
  EXPECT_TRUE(fingerprintDB != nullptr);
  EXPECT_EQ(error, "");

  sqlite3 *db = nullptr;
  sqlite3_open(path.c_str(), &db);
  sqlite3_exec(db, "PRAGMA locking_mode = EXCLUSIVE; BEGIN EXCLUSIVE;",
               nullptr, nullptr, nullptr);

  // The database is opened lazily, thus starting a build is what fails.
  EXPECT_FALSE(fingerprintDB->buildStarted(&error));

  std::stringstream out;
  out << "accessing fingerprint database \"" << path
      << "\": database is locked Possibly there are two concurrent builds "
         "running in the same filesystem location.";
  EXPECT_EQ(error, out.str());

  // Clean up database connections before the directory is removed.
  sqlite3_exec(db, "END;", nullptr, nullptr, nullptr);
  sqlite3_close(db);
}

static void replaceStoredValue(StringRef path, StringRef name,
                               const std::vector<uint8_t>& value) {
  sqlite3 *db = nullptr;
  ASSERT_EQ(SQLITE_OK, sqlite3_open(path.str().c_str(), &db));
  sqlite3_stmt *stmt = nullptr;
  ASSERT_EQ(SQLITE_OK, sqlite3_prepare_v2(
                db, "UPDATE fingerprints SET value = ? WHERE name == ?;",
                -1, &stmt, nullptr));
  EXPECT_EQ(SQLITE_OK, sqlite3_bind_blob(stmt, 1, value.data(), value.size(),
                                         SQLITE_TRANSIENT));
  EXPECT_EQ(SQLITE_OK, sqlite3_bind_text(stmt, 2, name.data(), name.size(),
                                         SQLITE_TRANSIENT));
  EXPECT_EQ(SQLITE_DONE, sqlite3_step(stmt));
  EXPECT_EQ(1, sqlite3_changes(db));
  sqlite3_finalize(stmt);
  sqlite3_close(db);
}

TEST(SQLiteFingerprintDBTest, corruptRecordIsReported) {
  TmpDir tempDir(__func__);
  std::string path = tempDir.path("build.db");

  std::string error;
  auto db = createSQLiteFingerprintDB(path, 1, &error);
  ASSERT_TRUE(db != nullptr) << error;
  ASSERT_TRUE(db->buildStarted(&error)) << error;
  auto a = makeFingerprint("a");
  EXPECT_TRUE(db->setFingerprint("a", a, &error)) << error;
  db->buildComplete();
  db.reset();

  // A truncated record.
  replaceStoredValue(path, "a", { 0x00 });

  db = createSQLiteFingerprintDB(path, 1, &error);
  ASSERT_TRUE(db != nullptr) << error;
  TargetFingerprint result;
  EXPECT_FALSE(db->lookupFingerprint("a", &result, &error));
  EXPECT_EQ("unexpected contents for database record: a", error);
  db.reset();

  // A record claiming an enormous number of inputs.
  basic::BinaryEncoder coder;
  coder.write(a.signature.value);
  coder.write(uint32_t(0xFFFFFFFF));
  coder.writeString("/project/a.in");
  replaceStoredValue(path, "a", coder.contents());

  error.clear();
  db = createSQLiteFingerprintDB(path, 1, &error);
  ASSERT_TRUE(db != nullptr) << error;
  EXPECT_FALSE(db->lookupFingerprint("a", &result, &error));
  EXPECT_EQ("unexpected contents for database record: a", error);

  // Other records are unaffected, and the record can be replaced.
  ASSERT_TRUE(db->buildStarted(&error)) << error;
  EXPECT_TRUE(db->setFingerprint("a", a, &error)) << error;
  db->buildComplete();
  error.clear();
  ASSERT_TRUE(db->lookupFingerprint("a", &result, &error)) << error;
  EXPECT_EQ(a.signature, result.signature);
}

TEST(InMemoryFingerprintDBTest, basic) {
  auto db = createInMemoryFingerprintDB();
  std::string error;
  ASSERT_TRUE(db->buildStarted(&error));

  TargetFingerprint result;
  EXPECT_FALSE(db->lookupFingerprint("b", &result, &error));
  EXPECT_TRUE(db->setFingerprint("b", makeFingerprint("b"), &error));
  EXPECT_TRUE(db->setFingerprint("a", makeFingerprint("a"), &error));
  ASSERT_TRUE(db->lookupFingerprint("b", &result, &error));
  EXPECT_EQ(basic::Signature("b"), result.signature);
  db->buildComplete();

  std::vector<std::string> names;
  ASSERT_TRUE(db->getTargetNames(names, &error));
  EXPECT_EQ(std::vector<std::string>({ "a", "b" }), names);

  EXPECT_TRUE(db->removeFingerprint("b", &error));
  EXPECT_FALSE(db->lookupFingerprint("b", &result, &error));
  EXPECT_EQ("", error);
}

}

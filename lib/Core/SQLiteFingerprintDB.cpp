//===-- SQLiteFingerprintDB.cpp -------------------------------------------===//
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
#include "pipebuild/Basic/PlatformUtility.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"

#include <cerrno>
#include <cstring>
#include <mutex>

#include <sqlite3.h>

using namespace pipebuild;
using namespace pipebuild::core;

// SQLite FingerprintDB Implementation

// Helper macro checking and returning error messages for failed SQLite calls
#define checkSQLiteResultOKReturnFalse(result) \
if (result != SQLITE_OK) { \
  *error_out = getCurrentErrorMessage(); \
  return false; \
}

namespace {

class SQLiteFingerprintDB : public FingerprintDB {
  /// Version History:
  /// * 2: Record depfile names alongside the file fingerprints.
  /// * 1: Initial schema.
  static const int currentSchemaVersion = 2;

  std::string path;
  uint32_t clientSchemaVersion;

  sqlite3 *db = nullptr;

  /// The mutex to protect all access to the database and statements.
  std::mutex dbMutex;

  /// Whether a build transaction is open.
  bool inTransaction = false;

  std::string getCurrentErrorMessage() {
    int err_code = sqlite3_errcode(db);
    const char* err_message = sqlite3_errmsg(db);
    const char* filename = sqlite3_db_filename(db, "main");

    std::string out;
    llvm::raw_string_ostream outStream(out);
    outStream << "accessing fingerprint database \""
              << (filename ? filename : path.c_str()) << "\": " << err_message;

    if (err_code == SQLITE_BUSY || err_code == SQLITE_LOCKED) {
      outStream << " Possibly there are two concurrent builds running in the "
                   "same filesystem location.";
    }

    outStream.flush();
    return out;
  }

  bool createSchema(std::string *error_out) {
    char *cError = nullptr;

    // Create the schema in a single transaction.
    int result = sqlite3_exec(db, "BEGIN EXCLUSIVE;", nullptr, nullptr, &cError);

    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE info ("
             "id INTEGER PRIMARY KEY, "
             "version INTEGER, "
             "client_version INTEGER);"),
        nullptr, nullptr, &cError);
    }
    if (result == SQLITE_OK) {
      char* query = sqlite3_mprintf(
        "INSERT INTO info VALUES (0, %d, %d);",
        currentSchemaVersion, clientSchemaVersion);
      result = sqlite3_exec(db, query, nullptr, nullptr, &cError);
      sqlite3_free(query);
    }
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE fingerprints ("
             "name STRING PRIMARY KEY, "
             "signature INTEGER, "
             "value BLOB);"),
        nullptr, nullptr, &cError);
    }

    // Sync changes to disk.
    if (result == SQLITE_OK) {
      result = sqlite3_exec(db, "END;", nullptr, nullptr, &cError);
    }

    if (result != SQLITE_OK) {
      *error_out = (std::string("unable to initialize database (") +
                    (cError ? cError : sqlite3_errstr(result)) + ")");
      sqlite3_free(cError);
      sqlite3_close(db);
      db = nullptr;
      return false;
    }

    return true;
  }

  bool open(std::string *error_out) {
    // The db is opened lazily whenever an operation on it occurs. Thus if it is
    // already open, we don't need to do any further work.
    if (db) return true;

    int result = sqlite3_open(path.c_str(), &db);
    if (result != SQLITE_OK) {
      *error_out = "unable to open database: " + std::string(
          sqlite3_errstr(result));
      sqlite3_close(db);
      db = nullptr;
      return false;
    }

    sqlite3_busy_timeout(db, 5000);

    // Check the stored schema version.
    int version;
    uint32_t clientVersion = 0;
    sqlite3_stmt* stmt;
    result = sqlite3_prepare_v2(
      db, "SELECT version,client_version FROM info LIMIT 1",
      -1, &stmt, nullptr);
    if (result == SQLITE_ERROR) {
      version = -1;
    } else {
      if (result != SQLITE_OK) {
        *error_out = getCurrentErrorMessage();
        return false;
      }
      result = sqlite3_step(stmt);
      if (result == SQLITE_DONE) {
        version = -1;
      } else if (result == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
        clientVersion = sqlite3_column_int(stmt, 1);
      } else {
        *error_out = getCurrentErrorMessage();
        sqlite3_finalize(stmt);
        return false;
      }
      sqlite3_finalize(stmt);
    }

    if (version != currentSchemaVersion ||
        clientVersion != clientSchemaVersion) {
      // Close the database before we try to recreate it.
      sqlite3_close(db);
      db = nullptr;

      // Always recreate the database from scratch when the schema changes.
      if (basic::sys::unlink(path.c_str()) == -1 && errno != ENOENT) {
        *error_out = std::string("unable to unlink existing database: ") +
          basic::sys::strerror(errno);
        return false;
      }

      result = sqlite3_open(path.c_str(), &db);
      if (result != SQLITE_OK) {
        *error_out = "unable to open database: " + std::string(
            sqlite3_errstr(result));
        sqlite3_close(db);
        db = nullptr;
        return false;
      }
      sqlite3_busy_timeout(db, 5000);

      if (!createSchema(error_out))
        return false;
    }

    // Initialize prepared statements.
    result = sqlite3_prepare_v2(
      db, findFingerprintStmtSQL, -1, &findFingerprintStmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, insertFingerprintStmtSQL, -1, &insertFingerprintStmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, deleteFingerprintStmtSQL, -1, &deleteFingerprintStmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    return true;
  }

  void close() {
    if (!db) return;

    // Destroy prepared statements.
    sqlite3_finalize(findFingerprintStmt);
    findFingerprintStmt = nullptr;
    sqlite3_finalize(insertFingerprintStmt);
    insertFingerprintStmt = nullptr;
    sqlite3_finalize(deleteFingerprintStmt);
    deleteFingerprintStmt = nullptr;

    sqlite3_close(db);
    db = nullptr;
  }

  static constexpr const char *findFingerprintStmtSQL = (
      "SELECT signature, value FROM fingerprints WHERE name == ?;");
  sqlite3_stmt* findFingerprintStmt = nullptr;

  static constexpr const char *insertFingerprintStmtSQL = (
      "INSERT OR REPLACE INTO fingerprints VALUES (?, ?, ?);");
  sqlite3_stmt* insertFingerprintStmt = nullptr;

  static constexpr const char *deleteFingerprintStmtSQL = (
      "DELETE FROM fingerprints WHERE name == ?;");
  sqlite3_stmt* deleteFingerprintStmt = nullptr;

public:
  SQLiteFingerprintDB(StringRef path, uint32_t clientSchemaVersion)
    : path(path.str()), clientSchemaVersion(clientSchemaVersion) { }

  virtual ~SQLiteFingerprintDB() {
    std::lock_guard<std::mutex> guard(dbMutex);
    if (db && inTransaction)
      sqlite3_exec(db, "END;", nullptr, nullptr, nullptr);
    close();
  }

  /// Open the database eagerly, to report configuration problems up front.
  bool initialize(std::string *error_out) {
    std::lock_guard<std::mutex> guard(dbMutex);
    if (!open(error_out))
      return false;
    // Release the file until a build starts.
    close();
    return true;
  }

  /// @name FingerprintDB API
  /// @{

  virtual bool lookupFingerprint(StringRef name, TargetFingerprint* result_out,
                                 std::string *error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    int result = sqlite3_reset(findFingerprintStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_clear_bindings(findFingerprintStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_text(findFingerprintStmt, /*index=*/1,
                               name.data(), name.size(), SQLITE_STATIC);
    checkSQLiteResultOKReturnFalse(result);

    // If the target wasn't found, we are done.
    result = sqlite3_step(findFingerprintStmt);
    if (result == SQLITE_DONE)
      return false;
    if (result != SQLITE_ROW) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    uint64_t signature = sqlite3_column_int64(findFingerprintStmt, 0);
    int numValueBytes = sqlite3_column_bytes(findFingerprintStmt, 1);
    const void* valueBytes = sqlite3_column_blob(findFingerprintStmt, 1);

    TargetFingerprint value;
    basic::BinaryDecoder decoder(
        StringRef(static_cast<const char*>(valueBytes), numValueBytes));
    decoder.read(value);
    if (!decoder.finish() || value.signature.value != signature) {
      *error_out = (llvm::Twine("unexpected contents for database record: ") +
                    name).str();
      return false;
    }

    *result_out = std::move(value);
    return true;
  }

  virtual bool setFingerprint(StringRef name, const TargetFingerprint& value,
                              std::string *error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    basic::BinaryEncoder encoder;
    encoder.write(value);
    auto bytes = encoder.contents();

    int result = sqlite3_reset(insertFingerprintStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_clear_bindings(insertFingerprintStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_text(insertFingerprintStmt, /*index=*/1,
                               name.data(), name.size(), SQLITE_STATIC);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_int64(insertFingerprintStmt, /*index=*/2,
                                value.signature.value);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_blob(insertFingerprintStmt, /*index=*/3,
                               bytes.data(), bytes.size(), SQLITE_STATIC);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_step(insertFingerprintStmt);
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    return true;
  }

  virtual bool removeFingerprint(StringRef name,
                                 std::string *error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    int result = sqlite3_reset(deleteFingerprintStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_clear_bindings(deleteFingerprintStmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_text(deleteFingerprintStmt, /*index=*/1,
                               name.data(), name.size(), SQLITE_STATIC);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_step(deleteFingerprintStmt);
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    return true;
  }

  virtual bool buildStarted(std::string *error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out))
      return false;

    // Execute the entire build inside a single transaction.
    int result = sqlite3_exec(db, "BEGIN EXCLUSIVE;", nullptr, nullptr, nullptr);

    if (result != SQLITE_OK) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    inTransaction = true;
    return true;
  }

  virtual void buildComplete() override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!db)
      return;

    // Sync changes to disk.
    if (inTransaction) {
      sqlite3_exec(db, "END;", nullptr, nullptr, nullptr);
      inTransaction = false;
    }

    // We close the connection whenever a build completes so that we release
    // any locks that we may have on the file.
    close();
  }

  virtual bool getTargetNames(std::vector<std::string>& names_out,
                              std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out))
      return false;

    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(
        db, "SELECT name FROM fingerprints ORDER BY name;", -1, &stmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
      auto size = sqlite3_column_bytes(stmt, 0);
      auto text = (const char*) sqlite3_column_text(stmt, 0);
      names_out.push_back(text ? std::string(text, size) : std::string());
    }

    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      sqlite3_finalize(stmt);
      return false;
    }

    sqlite3_finalize(stmt);
    return true;
  }

  /// @}
};

}

std::unique_ptr<FingerprintDB> core::createSQLiteFingerprintDB(
    StringRef path, uint32_t clientSchemaVersion, std::string* error_out) {
  auto db = std::make_unique<SQLiteFingerprintDB>(path, clientSchemaVersion);
  if (!db->initialize(error_out))
    return nullptr;
  return std::move(db);
}

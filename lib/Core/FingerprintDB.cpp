//===-- FingerprintDB.cpp -------------------------------------------------===//
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

#include "llvm/ADT/StringMap.h"

#include <algorithm>
#include <mutex>

using namespace pipebuild;
using namespace pipebuild::core;

FingerprintDB::~FingerprintDB() {}

namespace {

/// Fingerprint database which keeps everything in memory.
///
/// Records are stored encoded, so that the in-memory database exercises the
/// same coding path as the persistent one.
class InMemoryFingerprintDB : public FingerprintDB {
  std::mutex dbMutex;
  llvm::StringMap<std::vector<uint8_t>> records;

public:
  bool lookupFingerprint(StringRef name, TargetFingerprint* result_out,
                         std::string*) override {
    std::lock_guard<std::mutex> guard(dbMutex);
    auto it = records.find(name);
    if (it == records.end())
      return false;

    TargetFingerprint value;
    basic::BinaryDecoder decoder(it->second);
    decoder.read(value);
    if (!decoder.finish())
      return false;
    *result_out = std::move(value);
    return true;
  }

  bool setFingerprint(StringRef name, const TargetFingerprint& value,
                      std::string*) override {
    std::lock_guard<std::mutex> guard(dbMutex);
    basic::BinaryEncoder encoder;
    encoder.write(value);
    records[name] = encoder.contents();
    return true;
  }

  bool removeFingerprint(StringRef name, std::string*) override {
    std::lock_guard<std::mutex> guard(dbMutex);
    records.erase(name);
    return true;
  }

  bool buildStarted(std::string*) override { return true; }
  void buildComplete() override {}

  bool getTargetNames(std::vector<std::string>& names_out,
                      std::string*) override {
    std::lock_guard<std::mutex> guard(dbMutex);
    std::vector<std::string> names;
    for (const auto& entry: records)
      names.push_back(entry.getKey().str());
    std::sort(names.begin(), names.end());
    names_out.insert(names_out.end(), names.begin(), names.end());
    return true;
  }
};

}

std::unique_ptr<FingerprintDB> core::createInMemoryFingerprintDB() {
  return std::make_unique<InMemoryFingerprintDB>();
}

//===- Hashing.h ------------------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_BASIC_HASHING_H
#define PIPEBUILD_BASIC_HASHING_H

#include "pipebuild/Basic/BinaryCoding.h"
#include "pipebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace pipebuild {
namespace basic {

/// A stable signature of a declaration, used to detect when the declaration
/// itself (rather than the files it refers to) has changed.
///
/// The signature is computed with MD5, and is stable across processes.
class Signature {
public:
  Signature() = default;
  Signature(StringRef string) { combine(string); }
  explicit Signature(uint64_t sig) : value(sig) {}

  bool isNull() const { return value == 0; }

  bool operator==(const Signature& other) const { return value == other.value; }
  bool operator!=(const Signature& other) const { return value != other.value; }

  Signature& combine(StringRef string);

  Signature& combine(const std::string& string) {
    return combine(StringRef(string));
  }

  Signature& combine(const char* string) {
    return combine(StringRef(string));
  }

  Signature& combine(bool b) {
    return combine(StringRef(b ? "1" : "0"));
  }

  template <typename T>
  Signature& combine(const std::vector<T>& list) {
    combine(uint64_t(list.size()));
    for (const auto& v: list) {
      combine(v);
    }
    return *this;
  }

  Signature& combine(uint64_t number);

  uint64_t value = 0;
};

template<>
struct BinaryCodingTraits<Signature> {
  static inline void encode(const Signature& value, BinaryEncoder& coder) {
    coder.write(value.value);
  }
  static inline void decode(Signature& value, BinaryDecoder& coder) {
    coder.read(value.value);
  }
};

}
}

#endif

//===-- Hashing.cpp -------------------------------------------------------===//
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

#include "pipebuild/Basic/Hashing.h"

#include "pipebuild/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/MD5.h"

namespace pipebuild {
namespace basic {

Signature& Signature::combine(StringRef string) {
  llvm::MD5 hasher;
  uint8_t previous[8];
  for (unsigned i = 0; i != 8; ++i)
    previous[i] = uint8_t(value >> (i * 8));
  hasher.update(llvm::ArrayRef<uint8_t>(previous, 8));
  // Mix in the length so that ("ab", "c") and ("a", "bc") differ.
  uint8_t length[8];
  for (unsigned i = 0; i != 8; ++i)
    length[i] = uint8_t(uint64_t(string.size()) >> (i * 8));
  hasher.update(llvm::ArrayRef<uint8_t>(length, 8));
  hasher.update(string);

  llvm::MD5::MD5Result result;
  hasher.final(result);
  value = result.low();
  // Reserve zero for the null signature.
  if (value == 0)
    value = 1;
  return *this;
}

Signature& Signature::combine(uint64_t number) {
  return combine(llvm::Twine(number).str());
}

}
}

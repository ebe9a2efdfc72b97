//===- unittests/Basic/BinaryCodingTest.cpp -------------------------------===//
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

#include "pipebuild/Basic/BinaryCoding.h"

#include "pipebuild/Basic/FileInfo.h"

#include "llvm/ADT/StringRef.h"

#include "gtest/gtest.h"

using namespace pipebuild;
using namespace pipebuild::basic;

struct CustomType {
  uint32_t a;
  std::string b;
};

inline bool operator==(const CustomType& lhs, const CustomType& rhs) {
  return lhs.a == rhs.a && lhs.b == rhs.b;
}

namespace pipebuild {
namespace basic {

template<>
struct BinaryCodingTraits<CustomType> {
  static inline void encode(const CustomType& value,
                            BinaryEncoder& coder) {
    coder.write(value.a);
    coder.writeString(value.b);
  }
  static inline void decode(CustomType& value, BinaryDecoder& coder) {
    coder.read(value.a);
    coder.readString(value.b);
  }
};

}
}

namespace {

template<typename T>
static std::vector<uint8_t> encode(const T& value) {
  BinaryEncoder encoder;
  encoder.write(value);
  return encoder.contents();
}

template<typename T>
void checkRoundtrip(const T& value) {
  auto data = encode(value);

  BinaryDecoder decoder(data);
  T result{};
  decoder.read(result);
  EXPECT_TRUE(decoder.finish());
  EXPECT_EQ(value, result);
}

TEST(BinaryCodingTest, basic) {
  checkRoundtrip(uint8_t(0xAB));
  checkRoundtrip(uint16_t(0xABCD));
  checkRoundtrip(uint32_t(0xABCD0123));
  checkRoundtrip(uint64_t(0xABCD01234567DCBAULL));

  // The encoding is little endian, independent of the host.
  EXPECT_EQ(std::vector<uint8_t>({ 0x23, 0x01, 0xCD, 0xAB }),
            encode(uint32_t(0xABCD0123)));
}

TEST(BinaryCodingTest, customTypes) {
  checkRoundtrip(CustomType{ 0xABCD, "hello world" });
  checkRoundtrip(CustomType{ 0, "" });

  FileInfo info;
  info.mode = 0100644;
  info.size = 1234;
  info.modTime = { 1700000000, 42 };
  info.checksum.bytes[0] = 0x12;
  info.checksum.bytes[15] = 0x34;
  checkRoundtrip(info);
}

TEST(BinaryCodingTest, bytes) {
  BinaryEncoder encoder;
  encoder.writeBytes(StringRef("hello"));
  encoder.writeBytes(StringRef("world"));
  auto result = encoder.contents();

  EXPECT_EQ(StringRef("helloworld"),
            StringRef(reinterpret_cast<const char*>(result.data()),
                      result.size()));

  BinaryDecoder decoder(result);
  StringRef s1, s2;
  decoder.readBytes(5, s1);
  decoder.readBytes(5, s2);
  EXPECT_EQ(StringRef("hello"), s1);
  EXPECT_EQ(StringRef("world"), s2);
  EXPECT_TRUE(decoder.finish());
}

TEST(BinaryCodingTest, truncatedInput) {
  auto data = encode(CustomType{ 7, "truncated" });
  data.resize(data.size() - 3);

  BinaryDecoder decoder(data);
  CustomType result{ 1, "unchanged" };
  decoder.read(result);
  EXPECT_TRUE(decoder.hasFailed());
  EXPECT_FALSE(decoder.finish());
  EXPECT_EQ(7u, result.a);
  EXPECT_EQ("", result.b);

  // Reads past the end keep yielding zero.
  uint64_t value = 1;
  decoder.read(value);
  EXPECT_EQ(0u, value);
  EXPECT_TRUE(decoder.hasFailed());
}

TEST(BinaryCodingTest, hugeLengthPrefix) {
  BinaryEncoder encoder;
  encoder.write(uint32_t(0xFFFFFFFF));
  encoder.writeBytes(StringRef("short"));
  auto data = encoder.contents();

  BinaryDecoder decoder(data);
  std::string result;
  decoder.readString(result);
  EXPECT_TRUE(decoder.hasFailed());
  EXPECT_EQ("", result);
  EXPECT_TRUE(decoder.isEmpty());
}

TEST(BinaryCodingTest, trailingData) {
  auto data = encode(uint32_t(1));
  data.push_back(0);

  BinaryDecoder decoder(data);
  uint32_t value;
  decoder.read(value);
  EXPECT_EQ(1u, value);
  EXPECT_FALSE(decoder.hasFailed());
  EXPECT_FALSE(decoder.finish());
}

}

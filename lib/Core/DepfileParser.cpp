//===-- DepfileParser.cpp -------------------------------------------------===//
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

#include "llvm/ADT/SmallString.h"

using namespace pipebuild;
using namespace pipebuild::core;

DepfileParser::ParseActions::~ParseActions() {}

#pragma mark - DepfileParser Implementation

static bool isLineContinuation(const char* cur, const char* end) {
  if (*cur != '\\' || cur + 1 == end)
    return false;
  if (cur[1] == '\n')
    return true;
  return cur[1] == '\r' && cur + 2 != end && cur[2] == '\n';
}

static bool isSeparatorChar(const char* cur, const char* end) {
  int c = *cur;
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
    isLineContinuation(cur, end);
}

/// Whether \arg cur points at the rule separator.
static bool isRuleSeparator(const char* cur, const char* end) {
  if (*cur != ':')
    return false;
  return cur + 1 == end || isSeparatorChar(cur + 1, end);
}

static void skipWhitespace(const char*& cur, const char* end) {
  while (cur != end) {
    if (*cur == ' ' || *cur == '\t' || *cur == '\n' || *cur == '\r') {
      ++cur;
      continue;
    }

    // Skip escaped newlines.
    if (isLineContinuation(cur, end)) {
      cur += (cur[1] == '\r') ? 3 : 2;
      continue;
    }

    break;
  }
}

/// Lex one word, unescaping it into \arg word.
static void lexWord(const char*& cur, const char* end,
                    SmallVectorImpl<char>& word) {
  word.clear();
  for (; cur != end; ++cur) {
    int c = *cur;

    if (c == '\\') {
      // A line continuation ends the word.
      if (isLineContinuation(cur, end))
        break;

      // A trailing backslash stands for itself.
      if (cur + 1 == end) {
        word.push_back('\\');
        continue;
      }

      // Otherwise, take the escaped character literally.
      ++cur;
      word.push_back(*cur);
      continue;
    }

    if (isSeparatorChar(cur, end) || isRuleSeparator(cur, end))
      break;

    word.push_back(c);
  }
}

bool DepfileParser::parse() {
  const char* begin = data.begin();
  const char* cur = data.begin();
  const char* end = data.end();
  bool sawSeparator = false;
  SmallString<256> word;

  while (true) {
    skipWhitespace(cur, end);
    if (cur == end)
      break;

    if (isRuleSeparator(cur, end)) {
      if (sawSeparator) {
        actions.error("multiple ': ' separators in depfile", cur - begin);
        return false;
      }
      sawSeparator = true;
      ++cur;
      continue;
    }

    lexWord(cur, end, word);
    if (sawSeparator) {
      actions.actOnInput(word);
    } else {
      actions.actOnOutput(word);
    }
  }

  if (!sawSeparator) {
    actions.error("missing ': ' separator in depfile", cur - begin);
    return false;
  }

  return true;
}

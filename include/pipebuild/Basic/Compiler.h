//===- Compiler.h -----------------------------------------------*- C++ -*-===//
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
//
// Compiler support and compatibility macros. Liberally taken from LLVM.
//
//===----------------------------------------------------------------------===//

#ifndef PIPEBUILD_BASIC_COMPILER_H
#define PIPEBUILD_BASIC_COMPILER_H

#if !defined(__has_feature)
#define __has_feature(x) 0
#endif

/// PIPEBUILD_DELETED_FUNCTION - Expands to = delete if the compiler supports
/// it. Use to mark functions as uncallable. Member functions with this should
/// be declared private.
///
/// class DontCopy {
/// private:
///   DontCopy(const DontCopy&) PIPEBUILD_DELETED_FUNCTION;
///   DontCopy &operator =(const DontCopy&) PIPEBUILD_DELETED_FUNCTION;
/// public:
///   ...
/// };
#if __has_feature(cxx_deleted_functions) || \
    defined(__GXX_EXPERIMENTAL_CXX0X__) || __cplusplus >= 201103L
#define PIPEBUILD_DELETED_FUNCTION = delete
#else
#define PIPEBUILD_DELETED_FUNCTION
#endif

#endif

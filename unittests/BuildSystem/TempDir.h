//===- unittests/BuildSystem/TempDir.h --------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_TESTS_TEMPDIR
#define PIPEBUILD_TESTS_TEMPDIR

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"

#include <string>

namespace pipebuild {

/// Creates a temporary directory in its constructor and removes it in its
/// destructor. Makes it available via str() and c_str().
class TmpDir {
private:
    TmpDir(const TmpDir&) = delete;
    TmpDir& operator=(const TmpDir&) = delete;

    llvm::SmallString<256> tempDir;

public:
    TmpDir(llvm::StringRef namePrefix = "");
    ~TmpDir();

    const char *c_str();
    std::string str() const;

    /// Get the path of \arg relativePath within the directory.
    std::string path(llvm::StringRef relativePath) const;

    /// Write \arg contents to \arg relativePath, creating parent directories.
    ///
    /// \returns The absolute path of the file.
    std::string writeFile(llvm::StringRef relativePath,
                          llvm::StringRef contents) const;
};

}

#endif /* PIPEBUILD_TESTS_TEMPDIR */

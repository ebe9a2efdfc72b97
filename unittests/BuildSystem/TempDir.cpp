//===- unittests/BuildSystem/TempDir.cpp ----------------------------------===//
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

#include "TempDir.h"

#include "pipebuild/Basic/FileSystem.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include <cassert>

pipebuild::TmpDir::TmpDir(llvm::StringRef namePrefix) {
    llvm::SmallString<256> tempDirPrefix;
    llvm::sys::path::system_temp_directory(true, tempDirPrefix);
    llvm::sys::path::append(tempDirPrefix, namePrefix);

    std::error_code ec = llvm::sys::fs::createUniqueDirectory(
        tempDirPrefix.str(), tempDir);
    assert(!ec);
    (void)ec;

    // Resolve any symbolic links in the temporary directory path, so paths
    // computed by tests match those the build resolves.
    llvm::SmallString<256> realPath;
    if (!llvm::sys::fs::real_path(tempDir, realPath))
        tempDir = realPath;
}

pipebuild::TmpDir::~TmpDir() {
    auto fs = basic::createLocalFileSystem();
    bool result = fs->remove(tempDir.c_str());
    assert(result);
    (void)result;
}

const char *pipebuild::TmpDir::c_str() { return tempDir.c_str(); }
std::string pipebuild::TmpDir::str() const { return tempDir.str().str(); }

std::string pipebuild::TmpDir::path(llvm::StringRef relativePath) const {
    llvm::SmallString<256> result(tempDir);
    llvm::sys::path::append(result, relativePath);
    return result.str().str();
}

std::string pipebuild::TmpDir::writeFile(llvm::StringRef relativePath,
                                         llvm::StringRef contents) const {
    auto fs = basic::createLocalFileSystem();
    std::string filePath = path(relativePath);
    bool result = fs->createDirectories(
        llvm::sys::path::parent_path(filePath).str());
    result = fs->writeFileContents(filePath, contents) && result;
    assert(result);
    (void)result;
    return filePath;
}

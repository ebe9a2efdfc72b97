//===-- ExecutionQueue.cpp ------------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2018 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "pipebuild/Basic/ExecutionQueue.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

using namespace pipebuild;
using namespace pipebuild::basic;

JobDescriptor::~JobDescriptor() {
}

void NamedJobDescriptor::getShortDescription(
    SmallVectorImpl<char> &result) const {
  result.append(name.begin(), name.end());
}

QueueJobContext::~QueueJobContext() {
}

ExecutionQueue::ExecutionQueue(ExecutionQueueDelegate& delegate)
  : delegate(delegate)
{
}

ExecutionQueue::~ExecutionQueue() {
}

ExecutionQueueDelegate::~ExecutionQueueDelegate() {
}

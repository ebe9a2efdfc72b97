//===-- BuildSystem.cpp ---------------------------------------------------===//
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

#include "pipebuild/BuildSystem/BuildSystem.h"

#include "pipebuild/Basic/ExecutionQueue.h"
#include "pipebuild/Basic/FileSystem.h"
#include "pipebuild/Basic/Logger.h"
#include "pipebuild/BuildSystem/Environment.h"
#include "pipebuild/BuildSystem/SourceVisitor.h"
#include "pipebuild/BuildSystem/Target.h"
#include "pipebuild/BuildSystem/TargetGraph.h"
#include "pipebuild/Core/FingerprintDB.h"

#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/Path.h"

#include <atomic>
#include <memory>
#include <mutex>

using namespace pipebuild;
using namespace pipebuild::basic;
using namespace pipebuild::buildsystem;

BuildSystemDelegate::~BuildSystemDelegate() {}

#pragma mark - BuildSystem implementation

namespace {

enum class TargetOutcome {
  /// The target has not been considered yet.
  Pending = 0,

  /// The target's action ran and its outputs were recorded.
  Executed,

  /// The target was up to date.
  Skipped,

  /// The target failed.
  Failed,

  /// The target was never run, because a dependency did not succeed or the
  /// build was cancelled.
  NotRun
};

/// Get the state of a file to record, including its checksum.
static FileInfo getRecordedFileInfo(FileSystem& fileSystem,
                                    const std::string& path) {
  FileInfo info = fileSystem.getFileInfo(path);
  if (info.isRegularFile())
    info.checksum = fileSystem.getFileChecksum(path);
  return info;
}

static std::vector<core::FileFingerprint>
fingerprintFiles(FileSystem& fileSystem,
                 const std::vector<std::string>& paths) {
  std::vector<core::FileFingerprint> result;
  result.reserve(paths.size());
  for (const auto& path: paths)
    result.push_back({ path, getRecordedFileInfo(fileSystem, path) });
  return result;
}

/// Get the input fingerprints to record after an action ran.
///
/// Inputs resolved before the action keep their state from that time; only
/// the inputs discovered since (through depfiles) are read from disk.
static std::vector<core::FileFingerprint>
recordInputs(FileSystem& fileSystem,
             std::vector<core::FileFingerprint> knownInputs,
             const std::vector<std::string>& finalPaths) {
  llvm::StringMap<unsigned> knownIndices;
  for (unsigned i = 0, e = knownInputs.size(); i != e; ++i)
    knownIndices.insert(std::make_pair(knownInputs[i].path, i));

  std::vector<core::FileFingerprint> result;
  result.reserve(finalPaths.size());
  for (const auto& path: finalPaths) {
    auto it = knownIndices.find(path);
    if (it != knownIndices.end()) {
      result.push_back(std::move(knownInputs[it->second]));
    } else {
      result.push_back({ path, getRecordedFileInfo(fileSystem, path) });
    }
  }
  return result;
}

/// Check the recorded files against the file system.
///
/// The checksum of a file is only computed when its size matches but its
/// timestamp does not.
///
/// \param current_out [out] The present state of each file, suitable for
/// refreshing the record.
/// \param reason_out [out] The first file found to differ.
static bool checkFiles(FileSystem& fileSystem,
                       const std::vector<core::FileFingerprint>& recorded,
                       std::vector<core::FileFingerprint>& current_out,
                       std::string& reason_out) {
  for (const auto& file: recorded) {
    FileInfo current = fileSystem.getFileInfo(file.path);
    if (!current.isMissing() && current.size == file.info.size) {
      if (current.modTime == file.info.modTime)
        current.checksum = file.info.checksum;
      else if (current.isRegularFile())
        current.checksum = fileSystem.getFileChecksum(file.path);
    }
    if (!file.info.isUpToDate(current)) {
      reason_out = (current.isMissing() ? "missing file '" :
                    "changed file '") + file.path + "'";
      return false;
    }
    current_out.push_back({ file.path, current });
  }
  return true;
}

static bool hasSamePaths(const std::vector<core::FileFingerprint>& recorded,
                         const std::vector<std::string>& paths) {
  if (recorded.size() != paths.size())
    return false;
  for (unsigned i = 0, e = paths.size(); i != e; ++i) {
    if (recorded[i].path != paths[i])
      return false;
  }
  return true;
}

/// Check the syntax of every source \arg target declares.
static llvm::Error validateDeclaration(const Target& target) {
  for (const auto& source: target.getInputs()) {
    if (auto error = source.validate())
      return error;
  }
  for (const auto& source: target.getOutputs()) {
    if (auto error = source.validate())
      return error;
  }
  return llvm::Error::success();
}

/// The state of one build.
struct BuildState {
  const TargetGraph& graph;
  const Environment& environment;
  BuildResult& result;

  /// Protects all of the below, and the result.
  std::mutex mutex;

  llvm::DenseMap<Target*, TargetOutcome> outcomes;

  /// The number of dependencies of each target which have not completed.
  llvm::DenseMap<Target*, unsigned> pendingDependencies;

  /// The queue descriptors, which must outlive the queue jobs.
  llvm::DenseMap<Target*, std::unique_ptr<NamedJobDescriptor>> descriptors;

  BuildState(const TargetGraph& graph, const Environment& environment,
             BuildResult& result)
    : graph(graph), environment(environment), result(result) {}

  /// Check whether \arg target may run, given the outcomes of its
  /// dependencies, which must all have completed.
  bool canRun(Target* target, bool& dependencyExecuted) {
    dependencyExecuted = false;
    for (auto* dependency: target->getDependencies()) {
      switch (outcomes[dependency]) {
      case TargetOutcome::Executed:
        dependencyExecuted = true;
        break;
      case TargetOutcome::Skipped:
        break;
      case TargetOutcome::Pending:
      case TargetOutcome::Failed:
      case TargetOutcome::NotRun:
        return false;
      }
    }
    return true;
  }
};

class BuildSystemImpl {
  BuildSystemDelegate& delegate;
  core::FingerprintDB& db;
  unsigned numLanes;

  NullExecutionQueueDelegate queueDelegate;

  /// Whether the current build was cancelled.
  std::atomic<bool> cancelled{false};

  /// The queue of the current concurrent build, if any.
  ExecutionQueue* currentQueue = nullptr;
  std::mutex queueMutex;

  /// Serializes delegate callbacks.
  std::mutex delegateMutex;

  /// Bring \arg target up to date.
  TargetOutcome processTarget(Target& target, const Environment& environment,
                              bool dependencyExecuted, std::string& error_out);

  /// Run \arg target and record its outcome in \arg state.
  TargetOutcome runTarget(BuildState& state, Target& target,
                          bool dependencyExecuted);

  void executeSerially(BuildState& state);
  void executeConcurrently(BuildState& state);
  void dispatch(BuildState& state, ExecutionQueue& queue, Target* target,
                bool dependencyExecuted);
  void completeTarget(BuildState& state, ExecutionQueue& queue, Target* target,
                      TargetOutcome outcome);

public:
  BuildSystemImpl(BuildSystemDelegate& delegate, core::FingerprintDB& db,
                  unsigned numLanes)
    : delegate(delegate), db(db), numLanes(numLanes) {}

  BuildSystemDelegate& getDelegate() { return delegate; }

  BuildResult build(ArrayRef<Target*> roots, const Environment& environment);

  void cancel() {
    cancelled = true;
    std::lock_guard<std::mutex> guard(queueMutex);
    if (currentQueue)
      currentQueue->cancelAllJobs();
  }
};

TargetOutcome
BuildSystemImpl::processTarget(Target& target, const Environment& environment,
                               bool dependencyExecuted,
                               std::string& error_out) {
  auto& fileSystem = environment.getFileSystem();
  auto& logger = environment.getLogger();
  const std::string& name = target.getName();

  SourceVisitor inputVisitor(environment, /*inputs=*/true);
  SourceVisitor outputVisitor(environment, /*inputs=*/false);

  auto inputs = inputVisitor.resolve(target.getInputs(),
                                     target.getDepfiles());
  if (!inputs) {
    error_out = llvm::toString(inputs.takeError());
    return TargetOutcome::Failed;
  }

  core::TargetFingerprint record;
  std::string error;
  bool hasRecord = db.lookupFingerprint(name, &record, &error);
  if (!error.empty()) {
    logger.warning(llvm::Twine("unable to read fingerprint of target '") +
                   name + "': " + error);
    hasRecord = false;
  }

  // Decide whether the target must run.
  basic::Signature signature = target.getSignature();
  std::vector<core::FileFingerprint> currentInputs;
  std::vector<core::FileFingerprint> currentOutputs;
  std::string reason;
  if (!hasRecord) {
    reason = "no previous build";
  } else if (record.signature != signature) {
    reason = "declaration changed";
  } else if (inputs->containsNewDepfile) {
    reason = "new depfile";
  } else if (dependencyExecuted) {
    reason = "a dependency was rebuilt";
  } else if (!hasSamePaths(record.inputs, inputs->sources)) {
    reason = "the set of inputs changed";
  } else if (checkFiles(fileSystem, record.inputs, currentInputs, reason)) {
    // The reason is set by the first mismatching file, if any.
    checkFiles(fileSystem, record.outputs, currentOutputs, reason);
  }

  if (reason.empty()) {
    record.inputs = std::move(currentInputs);
    record.outputs = std::move(currentOutputs);
    if (!db.setFingerprint(name, record, &error)) {
      logger.warning(llvm::Twine("unable to refresh fingerprint of target '") +
                     name + "': " + error);
    }
    {
      std::lock_guard<std::mutex> guard(delegateMutex);
      delegate.targetSkipped(target);
    }
    return TargetOutcome::Skipped;
  }

  logger.verbose(llvm::Twine("building '") + name + "' (" + reason + ")");
  {
    std::lock_guard<std::mutex> guard(delegateMutex);
    delegate.targetStarted(target);
  }

  // Capture the inputs as the action sees them; an edit made while it runs
  // must cause the next build to run it again.
  auto knownInputs = fingerprintFiles(fileSystem, inputs->sources);

  if (auto actionError = target.build(environment)) {
    error_out = llvm::toString(std::move(actionError));
    return TargetOutcome::Failed;
  }

  // Verify the action produced every explicitly declared output.
  for (const auto& output: target.getOutputs()) {
    if (!output.isPattern() || output.isOptional() || output.hasWildcard())
      continue;
    auto resolved = outputVisitor.visit(output);
    if (!resolved) {
      error_out = llvm::toString(resolved.takeError());
      return TargetOutcome::Failed;
    }
    for (const auto& path: resolved->sources) {
      if (!fileSystem.exists(path)) {
        error_out = "declared output '" + path + "' was not produced";
        return TargetOutcome::Failed;
      }
    }
  }
  for (const auto& depfile: target.getDepfiles()) {
    llvm::SmallString<256> path(environment.getBuildDirectory());
    llvm::sys::path::append(path, depfile);
    if (!fileSystem.exists(path.str().str())) {
      error_out = "depfile '" + depfile + "' was not produced";
      return TargetOutcome::Failed;
    }
  }

  // Record the files as they are now, including the depfile contents which
  // may not have existed before the first run.
  auto finalInputs = inputVisitor.resolve(target.getInputs(),
                                          target.getDepfiles());
  if (!finalInputs) {
    error_out = llvm::toString(finalInputs.takeError());
    return TargetOutcome::Failed;
  }
  auto outputs = outputVisitor.resolve(target.getOutputs(),
                                       target.getDepfiles());
  if (!outputs) {
    error_out = llvm::toString(outputs.takeError());
    return TargetOutcome::Failed;
  }

  core::TargetFingerprint newRecord;
  newRecord.signature = signature;
  newRecord.inputs = recordInputs(fileSystem, std::move(knownInputs),
                                  finalInputs->sources);
  newRecord.outputs = fingerprintFiles(fileSystem, outputs->sources);
  newRecord.depfiles = target.getDepfiles();
  if (!db.setFingerprint(name, newRecord, &error)) {
    error_out = "unable to record fingerprint: " + error;
    return TargetOutcome::Failed;
  }

  {
    std::lock_guard<std::mutex> guard(delegateMutex);
    delegate.targetFinished(target);
  }
  return TargetOutcome::Executed;
}

TargetOutcome BuildSystemImpl::runTarget(BuildState& state, Target& target,
                                         bool dependencyExecuted) {
  std::string message;
  TargetOutcome outcome = processTarget(target, state.environment,
                                        dependencyExecuted, message);

  if (outcome == TargetOutcome::Failed) {
    // Forget the last good state, so the next build retries the target.
    std::string error;
    if (!db.removeFingerprint(target.getName(), &error)) {
      state.environment.getLogger().warning(
          llvm::Twine("unable to remove fingerprint of target '") +
          target.getName() + "': " + error);
    }
    std::lock_guard<std::mutex> guard(delegateMutex);
    delegate.targetFailed(target, message);
  }

  std::lock_guard<std::mutex> guard(state.mutex);
  switch (outcome) {
  case TargetOutcome::Executed:
    state.result.executedTargets.push_back(target.getName());
    break;
  case TargetOutcome::Skipped:
    state.result.skippedTargets.push_back(target.getName());
    break;
  case TargetOutcome::Failed:
    state.result.failures.push_back({ target.getName(), message });
    break;
  case TargetOutcome::Pending:
  case TargetOutcome::NotRun:
    llvm_unreachable("unexpected outcome of a processed target");
  }
  return outcome;
}

void BuildSystemImpl::executeSerially(BuildState& state) {
  for (auto* target: state.graph.getTargets()) {
    if (cancelled) {
      state.result.cancelled = true;
      return;
    }

    bool dependencyExecuted;
    if (!state.canRun(target, dependencyExecuted)) {
      state.outcomes[target] = TargetOutcome::NotRun;
      continue;
    }
    state.outcomes[target] = runTarget(state, *target, dependencyExecuted);
  }
}

void BuildSystemImpl::dispatch(BuildState& state, ExecutionQueue& queue,
                               Target* target, bool dependencyExecuted) {
  auto* descriptor = state.descriptors.find(target)->second.get();
  queue.addJob(QueueJob(descriptor,
      [this, &state, &queue, target,
       dependencyExecuted](QueueJobContext* context) {
        TargetOutcome outcome;
        if (context->isCancelled() || cancelled) {
          {
            std::lock_guard<std::mutex> guard(state.mutex);
            state.result.cancelled = true;
          }
          outcome = TargetOutcome::NotRun;
        } else {
          outcome = runTarget(state, *target, dependencyExecuted);
        }
        completeTarget(state, queue, target, outcome);
      }));
}

void BuildSystemImpl::completeTarget(BuildState& state, ExecutionQueue& queue,
                                     Target* target, TargetOutcome outcome) {
  std::vector<std::pair<Target*, bool>> ready;
  {
    std::lock_guard<std::mutex> guard(state.mutex);
    state.outcomes[target] = outcome;

    // Release the dependents whose dependencies are now complete; those which
    // cannot run complete immediately, releasing their own dependents.
    std::vector<Target*> completed{ target };
    while (!completed.empty()) {
      Target* current = completed.back();
      completed.pop_back();
      for (auto* dependent: state.graph.getDependents(current)) {
        if (--state.pendingDependencies[dependent] != 0)
          continue;
        bool dependencyExecuted;
        if (state.canRun(dependent, dependencyExecuted)) {
          ready.push_back({ dependent, dependencyExecuted });
        } else {
          state.outcomes[dependent] = TargetOutcome::NotRun;
          completed.push_back(dependent);
        }
      }
    }
  }

  for (const auto& entry: ready)
    dispatch(state, queue, entry.first, entry.second);
}

void BuildSystemImpl::executeConcurrently(BuildState& state) {
  for (auto* target: state.graph.getTargets()) {
    state.pendingDependencies[target];
    state.descriptors[target] =
        std::make_unique<NamedJobDescriptor>(target->getName());
    for (auto* dependent: state.graph.getDependents(target))
      ++state.pendingDependencies[dependent];
  }

  auto queue = createLaneBasedExecutionQueue(queueDelegate, numLanes);
  {
    std::lock_guard<std::mutex> guard(queueMutex);
    currentQueue = queue.get();
  }
  if (cancelled)
    queue->cancelAllJobs();

  std::vector<Target*> initial;
  for (auto* target: state.graph.getTargets()) {
    if (state.pendingDependencies[target] == 0)
      initial.push_back(target);
  }
  for (auto* target: initial)
    dispatch(state, *queue, target, /*dependencyExecuted=*/false);

  queue->waitForAllJobs();

  std::lock_guard<std::mutex> guard(queueMutex);
  currentQueue = nullptr;
}

BuildResult BuildSystemImpl::build(ArrayRef<Target*> roots,
                                   const Environment& environment) {
  BuildResult result;
  cancelled = false;

  // Validate the whole graph before running anything.
  auto graph = TargetGraph::create(roots);
  if (!graph) {
    std::string message = llvm::toString(graph.takeError());
    environment.getLogger().error(message);
    result.failures.push_back({ "", message });
    return result;
  }

  // Malformed source declarations are configuration errors as well.
  for (auto* target: graph->getTargets()) {
    if (auto declarationError = validateDeclaration(*target)) {
      std::string message = (llvm::Twine("invalid declaration of target '") +
                             target->getName() + "': " +
                             llvm::toString(std::move(declarationError))).str();
      environment.getLogger().error(message);
      result.failures.push_back({ "", message });
      return result;
    }
  }

  std::string error;
  if (!db.buildStarted(&error)) {
    std::string message = "unable to open build database: " + error;
    environment.getLogger().error(message);
    result.failures.push_back({ "", message });
    return result;
  }

  BuildState state(*graph, environment, result);
  if (numLanes <= 1) {
    executeSerially(state);
  } else {
    executeConcurrently(state);
  }

  db.buildComplete();

  result.success = result.failures.empty() && !result.cancelled;
  return result;
}

}

#pragma mark - BuildSystem

BuildSystem::BuildSystem(BuildSystemDelegate& delegate,
                         core::FingerprintDB& db, unsigned numLanes)
  : impl(new BuildSystemImpl(delegate, db, numLanes))
{
}

BuildSystem::~BuildSystem() {
  delete static_cast<BuildSystemImpl*>(impl);
}

BuildSystemDelegate& BuildSystem::getDelegate() {
  return static_cast<BuildSystemImpl*>(impl)->getDelegate();
}

BuildResult BuildSystem::build(Target& root, const Environment& environment) {
  Target* roots[] = { &root };
  return static_cast<BuildSystemImpl*>(impl)->build(roots, environment);
}

BuildResult BuildSystem::build(ArrayRef<Target*> roots,
                               const Environment& environment) {
  return static_cast<BuildSystemImpl*>(impl)->build(roots, environment);
}

void BuildSystem::cancel() {
  static_cast<BuildSystemImpl*>(impl)->cancel();
}

//===- ExecutionQueue.h -----------------------------------------*- C++ -*-===//
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

#ifndef PIPEBUILD_BASIC_EXECUTIONQUEUE_H
#define PIPEBUILD_BASIC_EXECUTIONQUEUE_H

#include "pipebuild/Basic/Compiler.h"
#include "pipebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace pipebuild {
  namespace basic {

    /// MARK: Execution Queue

    class ExecutionQueueDelegate;

    /// Description of the queue job, used for scheduling and diagnostics.
    class JobDescriptor {
    public:
      JobDescriptor() {}
      virtual ~JobDescriptor();

      /// Get a name used for ordering this job.
      virtual StringRef getOrdinalName() const = 0;

      /// Get a short description of the job, for use in status reporting.
      virtual void getShortDescription(SmallVectorImpl<char> &result) const = 0;
    };

    /// A job descriptor carrying a fixed name.
    class NamedJobDescriptor : public JobDescriptor {
      std::string name;

    public:
      explicit NamedJobDescriptor(StringRef name) : name(name.str()) {}

      StringRef getOrdinalName() const override { return name; }
      void getShortDescription(SmallVectorImpl<char> &result) const override;
    };

    /// Opaque type which allows the queue implementation to maintain additional
    /// state and expose it to the dispatching job.
    class QueueJobContext {
    public:
      virtual ~QueueJobContext();
      virtual unsigned laneID() const = 0;

      /// Whether the queue was cancelled before this job started.
      ///
      /// Jobs observing cancellation should skip their work and return.
      virtual bool isCancelled() const = 0;
    };

    /// Wrapper for individual pieces of work that are added to the execution
    /// queue.
    class QueueJob {
      JobDescriptor* desc = nullptr;

      /// The function to execute to do the work.
      typedef std::function<void(QueueJobContext*)> work_fn_ty;
      work_fn_ty work;

    public:
      /// Default constructor, for use as a sentinel.
      QueueJob() {}

      /// General constructor.
      QueueJob(JobDescriptor* desc, work_fn_ty work)
      : desc(desc), work(work) {}

      JobDescriptor* getDescriptor() const { return desc; }

      void execute(QueueJobContext* context) { work(context); }
    };

    /// This abstact class encapsulates the interface needed for contributing
    /// work which needs to be executed.
    class ExecutionQueue {
      // DO NOT COPY
      ExecutionQueue(const ExecutionQueue&) PIPEBUILD_DELETED_FUNCTION;
      void operator=(const ExecutionQueue&) PIPEBUILD_DELETED_FUNCTION;
      ExecutionQueue& operator=(ExecutionQueue&&) PIPEBUILD_DELETED_FUNCTION;

      ExecutionQueueDelegate& delegate;

    public:
      ExecutionQueue(ExecutionQueueDelegate& delegate);
      virtual ~ExecutionQueue();

      /// @name Accessors
      /// @{

      ExecutionQueueDelegate& getDelegate() { return delegate; }
      const ExecutionQueueDelegate& getDelegate() const { return delegate; }

      /// Get the number of lanes actually in use.
      virtual unsigned getNumLanes() const = 0;

      /// @}

      /// Add a job to be executed.
      ///
      /// The descriptor must outlive the execution of the job.
      virtual void addJob(QueueJob job) = 0;

      /// Cancel all jobs of this queue.
      ///
      /// Jobs already running are allowed to finish; jobs which have not yet
      /// started still run, but observe \see QueueJobContext::isCancelled().
      virtual void cancelAllJobs() = 0;

      /// Block until every job added so far has finished executing.
      virtual void waitForAllJobs() = 0;
    };

    /// Delegate interface for execution queue status.
    ///
    /// NOTE: The delegate *MUST* be thread-safe with respect to all calls, which
    /// will arrive concurrently and without any specified thread.
    class ExecutionQueueDelegate {
      // DO NOT COPY
      ExecutionQueueDelegate(const ExecutionQueueDelegate&)
          PIPEBUILD_DELETED_FUNCTION;
      void operator=(const ExecutionQueueDelegate&) PIPEBUILD_DELETED_FUNCTION;
      ExecutionQueueDelegate &operator=(ExecutionQueueDelegate&& rhs)
          PIPEBUILD_DELETED_FUNCTION;

    public:
      ExecutionQueueDelegate() {}
      virtual ~ExecutionQueueDelegate();

      /// Called when a job has been started.
      ///
      /// The queue guarantees that any jobStarted() call will be paired with
      /// exactly one \see jobFinished() call.
      virtual void queueJobStarted(JobDescriptor*) = 0;

      /// Called when a job has been finished.
      virtual void queueJobFinished(JobDescriptor*) = 0;
    };

    /// An execution queue delegate which ignores all status.
    class NullExecutionQueueDelegate : public ExecutionQueueDelegate {
    public:
      void queueJobStarted(JobDescriptor*) override {}
      void queueJobFinished(JobDescriptor*) override {}
    };

    // MARK: Lane Based Execution Queue

    enum class SchedulerAlgorithm {
      /// Name priority queue based scheduling
      NamePriority = 0,

      /// First in, first out [default]
      FIFO = 1
    };

    /// Create an execution queue that schedules jobs to individual lanes with a
    /// capped limit on the number of concurrent lanes.
    ///
    /// \param numLanes The requested number of lanes; the queue may use fewer
    /// when the open file limit cannot support that many concurrent jobs.
    std::unique_ptr<ExecutionQueue> createLaneBasedExecutionQueue(
        ExecutionQueueDelegate& delegate, unsigned numLanes,
        SchedulerAlgorithm alg = SchedulerAlgorithm::FIFO);

    /// Returns the number of lanes the open file limit allows, given a
    /// requested number.
    unsigned estimateLaneLimit(unsigned numLanes);
  }
}

#endif

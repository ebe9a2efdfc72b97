//===-- LaneBasedExecutionQueue.cpp ---------------------------------------===//
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

#include "pipebuild/Basic/ExecutionQueue.h"
#include "pipebuild/Basic/PlatformUtility.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"

#include <algorithm>
#include <climits>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include <pthread.h>

using namespace pipebuild;
using namespace pipebuild::basic;

struct QueueJobLess {
  bool operator()(const QueueJob &lhs, const QueueJob &rhs) const {
    return lhs.getDescriptor()->getOrdinalName() <
            rhs.getDescriptor()->getOrdinalName();
  }
};

namespace {

struct LaneBasedExecutionQueueJobContext : public QueueJobContext {
  uint64_t laneNumber;
  bool cancelled;

  LaneBasedExecutionQueueJobContext(uint64_t laneNumber, bool cancelled)
      : laneNumber(laneNumber), cancelled(cancelled) {}

  unsigned laneID() const override { return laneNumber; }
  bool isCancelled() const override { return cancelled; }
};

class Scheduler {
public:
  virtual ~Scheduler() { }

  virtual void addJob(QueueJob job) = 0;
  virtual QueueJob getNextJob() = 0;
  virtual bool empty() const = 0;
  virtual uint64_t size() const = 0;

  static std::unique_ptr<Scheduler> make(SchedulerAlgorithm alg);
};

/// Build execution queue.
class LaneBasedExecutionQueue : public ExecutionQueue {
  /// The number of lanes the queue was configured with.
  unsigned numLanes;

  /// A thread for each lane.
  std::vector<std::unique_ptr<std::thread>> lanes;

  /// The ready queue of jobs to execute.
  std::unique_ptr<Scheduler> readyJobs;
  std::mutex readyJobsMutex;
  std::condition_variable readyJobsCondition;
  bool cancelled { false };
  bool shutdown { false };

  /// The number of jobs added but not yet finished.
  uint64_t outstandingJobs { 0 };
  std::condition_variable idleCondition;

  void executeLane(uint32_t laneNumber) {
    // Set the thread name, if available.
#if defined(__APPLE__)
    pthread_setname_np(
        (llvm::Twine("pipebuild Lane-") + llvm::Twine(laneNumber)).str().c_str());
#elif defined(__linux__)
    pthread_setname_np(
        pthread_self(),
        (llvm::Twine("pipebuild-") + llvm::Twine(laneNumber)).str().c_str());
#endif

    // Execute items from the queue until shutdown.
    while (true) {
      // Take a job from the ready queue.
      QueueJob job{};
      bool wasCancelled;
      {
        std::unique_lock<std::mutex> lock(readyJobsMutex);

        // While the queue is empty, wait for an item.
        while (!shutdown && readyJobs->empty()) {
          readyJobsCondition.wait(lock);
        }
        if (shutdown && readyJobs->empty())
          return;

        job = readyJobs->getNextJob();
        wasCancelled = cancelled;
      }

      // If we got an empty job, the queue is shutting down.
      if (!job.getDescriptor())
        break;

      LaneBasedExecutionQueueJobContext context{ laneNumber, wasCancelled };
      getDelegate().queueJobStarted(job.getDescriptor());
      job.execute(&context);
      getDelegate().queueJobFinished(job.getDescriptor());

      {
        std::lock_guard<std::mutex> guard(readyJobsMutex);
        if (--outstandingJobs == 0)
          idleCondition.notify_all();
      }
    }
  }

public:
  LaneBasedExecutionQueue(ExecutionQueueDelegate& delegate,
                          unsigned numLanesSuggestion, SchedulerAlgorithm alg)
  : ExecutionQueue(delegate), readyJobs(Scheduler::make(alg))
  {
    numLanes = estimateLaneLimit(numLanesSuggestion);

    for (unsigned i = 0; i != numLanes; ++i) {
      lanes.push_back(std::unique_ptr<std::thread>(
                          new std::thread(
                              &LaneBasedExecutionQueue::executeLane, this, i)));
    }
  }

  virtual ~LaneBasedExecutionQueue() {
    // Shut down the lanes.
    {
      std::unique_lock<std::mutex> lock(readyJobsMutex);
      shutdown = true;
      readyJobsCondition.notify_all();
    }

    for (unsigned i = 0; i != numLanes; ++i) {
      lanes[i]->join();
    }
  }

  virtual unsigned getNumLanes() const override { return numLanes; }

  virtual void addJob(QueueJob job) override {
    std::lock_guard<std::mutex> guard(readyJobsMutex);
    ++outstandingJobs;
    readyJobs->addJob(job);
    readyJobsCondition.notify_one();
  }

  virtual void cancelAllJobs() override {
    std::lock_guard<std::mutex> lock(readyJobsMutex);
    if (cancelled) return;
    cancelled = true;
    readyJobsCondition.notify_all();
  }

  virtual void waitForAllJobs() override {
    std::unique_lock<std::mutex> lock(readyJobsMutex);
    while (outstandingJobs != 0) {
      idleCondition.wait(lock);
    }
  }
};

class PriorityQueueScheduler : public Scheduler {
private:
  std::priority_queue<QueueJob, std::vector<QueueJob>, QueueJobLess> jobs;

public:
  void addJob(QueueJob job) override {
    jobs.push(job);
  }

  QueueJob getNextJob() override {
    QueueJob job = jobs.top();
    jobs.pop();
    return job;
  }

  bool empty() const override {
    return jobs.empty();
  }

  uint64_t size() const override {
    return jobs.size();
  }
};

class FifoScheduler : public Scheduler {
private:
  std::deque<QueueJob> jobs;

public:
  void addJob(QueueJob job) override {
    jobs.push_back(job);
  }

  QueueJob getNextJob() override {
    QueueJob job = jobs.front();
    jobs.pop_front();
    return job;
  }

  bool empty() const override {
    return jobs.empty();
  }

  uint64_t size() const override {
    return jobs.size();
  }
};

std::unique_ptr<Scheduler> Scheduler::make(SchedulerAlgorithm alg) {
  switch (alg) {
    case SchedulerAlgorithm::NamePriority:
      return std::unique_ptr<Scheduler>(new PriorityQueueScheduler);
    case SchedulerAlgorithm::FIFO:
      return std::unique_ptr<Scheduler>(new FifoScheduler);
  }
  llvm_unreachable("unknown scheduler algorithm");
}

} // anonymous namespace

unsigned pipebuild::basic::estimateLaneLimit(unsigned numLanes) {
  sys::pipebuild_rlim_t curOpenFileLimit = sys::getOpenFileLimit();
  const unsigned reservedFileCount =   3 /* stdin, stdout, stderr */
                                     + 2 /* Database */
                                     + 1 /* Logging */
                                     + 2 /* Fudge factor */;
  numLanes = std::max(1u, numLanes);
  if (curOpenFileLimit < reservedFileCount) {
    // Maybe even can't afford building altogether, but let's risk it.
    return 1;
  }

  unsigned allowedFilesForTasks = static_cast<unsigned>(
      std::min(curOpenFileLimit, static_cast<sys::pipebuild_rlim_t>(INT_MAX)))
    - reservedFileCount;
  unsigned filesPerTask = 2;  // A copy holds a source and a destination.
  unsigned maxConcurrentTasks = allowedFilesForTasks / filesPerTask;

  return std::max(1u, std::min(numLanes, maxConcurrentTasks));
}

std::unique_ptr<ExecutionQueue> pipebuild::basic::createLaneBasedExecutionQueue(
    ExecutionQueueDelegate& delegate, unsigned numLanes,
    SchedulerAlgorithm alg) {
  return std::make_unique<LaneBasedExecutionQueue>(delegate, numLanes, alg);
}

// consumer/read_worker.h - Thread pool that drives ReadTasks to completion
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CONSUMER_READ_WORKER_H
#define CONSUMER_READ_WORKER_H

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "base/clock.h"
#include "consumer/consumer_state.h"
#include "consumer/read_task.h"

namespace consumer {

// A ReadWorkerStats holds statistics about a running ReadWorker.
// All fields are advisory only, as these statistics are only a snapshot.
struct ReadWorkerStats {
  // |num_workers| is the number of worker threads still running.
  std::size_t num_workers;

  // |pending_count| is the number of tasks ready to be stepped.
  std::size_t pending_count;

  // |waiting_count| is the number of tasks backing off.
  std::size_t waiting_count;

  // |active_count| is the number of tasks being stepped right now.
  std::size_t active_count;

  // |completed_count| is the number of tasks that have completed.
  std::size_t completed_count;

  ReadWorkerStats() noexcept : num_workers(0),
                               pending_count(0),
                               waiting_count(0),
                               active_count(0),
                               completed_count(0) {}
};

// ReadWorker owns a fixed pool of threads that repeatedly step ReadTasks.
//
// A task that asks to continue goes to the back of the ready queue; a task
// that backs off waits, ordered by its |StepSignal::until()|, and rejoins
// the ready queue once that time has passed; a task that is done is dropped.
// A task is never stepped by two threads at once.
//
// THREAD SAFETY: This class is thread-safe.
//
class ReadWorker {
 public:
  // Starts |num_threads| threads. Backoff expirations are measured with
  // |clock|, which should be the clock of the ConsumerStates being read.
  ReadWorker(std::size_t num_threads, base::MonotonicClock clock);
  explicit ReadWorker(std::size_t num_threads)
      : ReadWorker(num_threads, base::system_monotonic_clock()) {}

  // Shuts down the ReadWorker, if that has not already happened.
  ~ReadWorker() noexcept;

  // ReadWorkers are neither copyable nor moveable.
  ReadWorker(const ReadWorker&) = delete;
  ReadWorker(ReadWorker&&) = delete;
  ReadWorker& operator=(const ReadWorker&) = delete;
  ReadWorker& operator=(ReadWorker&&) = delete;

  // Creates a ReadTask and schedules it.
  // PRECONDITION: |shutdown()| has not been called
  std::shared_ptr<ReadTask> read(ConsumerState* state, std::string topic,
                                 uint64_t max_bytes, ResultSink sink);

  // Schedules an existing ReadTask.
  // PRECONDITION: |shutdown()| has not been called
  void submit(std::shared_ptr<ReadTask> task);

  // Waits for every scheduled task to complete, then stops the threads.
  // Every task is bounded by its own deadline, so this always returns.
  void shutdown();

  ReadWorkerStats stats() const;

 private:
  using TaskPtr = std::shared_ptr<ReadTask>;

  void loop();
  bool idle() const noexcept;  // mu_ held by caller

  const base::MonotonicClock clock_;
  mutable std::mutex mu_;
  std::condition_variable work_cv_;  // mu_: ready_ non-empty or stopping_
  std::condition_variable idle_cv_;  // mu_: idle()
  std::deque<TaskPtr> ready_;                         // protected by mu_
  std::multimap<base::MonotonicTime, TaskPtr> waiting_;  // protected by mu_
  std::vector<std::thread> threads_;                  // protected by mu_
  std::size_t running_;                               // protected by mu_
  std::size_t active_;                                // protected by mu_
  std::size_t completed_;                             // protected by mu_
  bool stopping_;                                     // protected by mu_
};

}  // namespace consumer

#endif  // CONSUMER_READ_WORKER_H

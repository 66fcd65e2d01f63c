// consumer/read_task.h - One budgeted, deadline-bound read from a topic
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CONSUMER_READ_TASK_H
#define CONSUMER_READ_TASK_H

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

#include "base/duration.h"
#include "base/result.h"
#include "base/time.h"
#include "consumer/consumer_state.h"
#include "consumer/record.h"
#include "event/promise.h"

namespace consumer {

// Enumeration of the things a scheduler may be told after a step.
enum class StepAction : uint8_t {
  // Step the task again as soon as possible.
  continue_now = 0,

  // Step the task again, but not before |StepSignal::until()|.
  backoff = 1,

  // The task has completed. Never step it again.
  done = 2,
};

void append_to(std::string* out, StepAction action);

inline std::ostream& operator<<(std::ostream& o, StepAction action) {
  std::string str;
  append_to(&str, action);
  return (o << str);
}

// StepSignal is the return value of |ReadTask::step()|.
class StepSignal {
 private:
  StepSignal(StepAction action, base::MonotonicTime until) noexcept
      : action_(action),
        until_(until) {}

 public:
  static StepSignal continue_now() noexcept {
    return StepSignal(StepAction::continue_now, base::MonotonicTime());
  }
  static StepSignal backoff_until(base::MonotonicTime t) noexcept {
    return StepSignal(StepAction::backoff, t);
  }
  static StepSignal done() noexcept {
    return StepSignal(StepAction::done, base::MonotonicTime());
  }

  // The default-constructed StepSignal is |done()|.
  StepSignal() noexcept : StepSignal(done()) {}
  StepSignal(const StepSignal&) noexcept = default;
  StepSignal& operator=(const StepSignal&) noexcept = default;

  StepAction action() const noexcept { return action_; }
  bool is_done() const noexcept { return action_ == StepAction::done; }
  bool is_backoff() const noexcept { return action_ == StepAction::backoff; }

  // Returns the earliest time of the next step.
  // PRECONDITION: |is_backoff()|
  base::MonotonicTime until() const noexcept { return until_; }

  void append_to(std::string* out) const;
  std::string as_string() const;

 private:
  StepAction action_;
  base::MonotonicTime until_;
};

inline bool operator==(const StepSignal& a, const StepSignal& b) noexcept {
  return a.action() == b.action() && a.until() == b.until();
}
inline bool operator!=(const StepSignal& a, const StepSignal& b) noexcept {
  return !(a == b);
}

inline std::ostream& operator<<(std::ostream& o, const StepSignal& signal) {
  return (o << signal.as_string());
}

// A ResultSink receives the records of a completed ReadTask.
using ResultSink = std::function<void(const Records&)>;

// A ReadTask is one client read: "give me at most N bytes from this topic,
// and answer within the request timeout".
//
// The task never blocks for long. Instead, a scheduler calls |step()|
// repeatedly; each step drains whatever the topic's iterator has ready,
// stopping short of any record that would push the task over its byte
// budget. The task completes when its budget is spent, when its deadline
// passes, or when something goes wrong. At completion it releases the topic,
// passes its records to the ResultSink, and wakes every thread in |get()|.
//
// A record that does not fit is left in the iterator for the next read.
//
// The task takes the topic's read lock on its first step and holds it until
// completion, across steps and across scheduler threads. While another task
// holds the lock, |step()| backs off instead of waiting for it.
//
// The deadline is anchored at construction. Backoff is anchored at the start
// of each step, so that timing does not depend on how long draining took.
//
// THREAD SAFETY: |step()| must never run on two threads at once. The
//                completion methods (|is_done()|, |get()|, and friends) are
//                thread-safe and may be called from anywhere.
//
class ReadTask {
 public:
  // Creates a read of up to |max_bytes| from |topic|.
  //
  // The topic is resolved immediately. If it cannot be resolved, the task is
  // complete on return, with no records, and |sink| has already run.
  //
  // |parent| must outlive the task. |sink| may be empty.
  //
  ReadTask(ConsumerState* parent, std::string topic, uint64_t max_bytes,
           ResultSink sink);

  ~ReadTask() noexcept;

  // ReadTasks are neither copyable nor moveable.
  ReadTask(const ReadTask&) = delete;
  ReadTask(ReadTask&&) = delete;
  ReadTask& operator=(const ReadTask&) = delete;
  ReadTask& operator=(ReadTask&&) = delete;

  // Performs one bounded partial read.
  // - Never throws; failures complete the task with its partial records
  // - Returns |done()| without side effects if the task is already complete
  StepSignal step();

  // Returns true iff the task has completed.
  bool is_done() const noexcept { return promise_.is_done(); }

  // Blocks until the task completes, then returns its records.
  const Records& get() const { return promise_.future().wait(); }

  // Blocks for at most |timeout| until the task completes.
  // - Returns OK and copies the records into |out| on completion
  // - Returns DEADLINE_EXCEEDED otherwise; the task keeps running
  base::Result get(base::Duration timeout, Records* out) const {
    return promise_.future().wait_for(timeout, out);
  }

  // ReadTasks cannot be cancelled; they end by their own deadline.
  bool cancel() noexcept { return false; }
  bool is_cancelled() const noexcept { return false; }

  // Registers a callback to run at completion, in addition to the sink.
  // - Runs |cb| immediately if the task has already completed
  void on_finished(ResultSink cb) { promise_.on_finished(std::move(cb)); }

  const std::string& topic() const noexcept { return topic_; }
  uint64_t max_response_bytes() const noexcept { return max_bytes_; }
  base::MonotonicTime started() const noexcept { return started_; }

  // The following accessors reflect the most recent step. They must not be
  // called while another thread is inside |step()|.

  uint64_t bytes_consumed() const noexcept { return bytes_consumed_; }

  // Returns the earliest time at which the task should be stepped again:
  // the sooner of the backoff expiration and the request expiration.
  base::MonotonicTime wait_expiration() const noexcept {
    return wait_expiration_;
  }

 private:
  base::Result drain(StepSignal* signal);
  StepSignal abort();
  void release();
  void finish();

  ConsumerState* const parent_;
  const std::string topic_;
  const uint64_t max_bytes_;
  const base::MonotonicTime started_;
  event::Promise<Records> promise_;
  TopicState* topic_state_;
  MessageIterator* iter_;
  bool reading_;
  Records records_;
  uint64_t bytes_consumed_;
  base::MonotonicTime wait_expiration_;
};

}  // namespace consumer

#endif  // CONSUMER_READ_TASK_H

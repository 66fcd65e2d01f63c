// consumer/topic.h - Per-topic read lock, iterator, and offset bookkeeping
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CONSUMER_TOPIC_H
#define CONSUMER_TOPIC_H

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "consumer/iterator.h"

namespace consumer {

using OffsetMap = std::map<int32_t, int64_t>;

// TopicState is the shared handle for one topic of one consumer.
//
// At most one reader drains the topic's iterator at a time. A reader is
// identified by an opaque, non-null |owner| token (a ReadTask passes
// |this|); the lock belongs to the token, not to a thread, so a reader that
// is stepped by several worker threads in turn keeps the lock throughout.
// The offset map records, per partition, the offset of the last record
// handed to a client.
//
// THREAD SAFETY: This class is thread-safe. The iterator itself may only be
//                used by the current holder of the read lock, one thread at
//                a time.
//
class TopicState {
 public:
  TopicState(std::string name, MessageIteratorPtr iter);
  ~TopicState() noexcept;

  // TopicStates are neither copyable nor moveable.
  TopicState(const TopicState&) = delete;
  TopicState(TopicState&&) = delete;
  TopicState& operator=(const TopicState&) = delete;
  TopicState& operator=(TopicState&&) = delete;

  const std::string& name() const noexcept { return name_; }

  // Blocks until the read lock is free, then takes it for |owner|.
  // PRECONDITION: |owner| does not already hold the read lock
  void start_read(const void* owner);

  // Takes the read lock for |owner| if it is free.
  // - Returns true iff the lock was taken
  bool try_start_read(const void* owner);

  // Releases the read lock.
  // PRECONDITION: |owner| holds the read lock
  void finish_read(const void* owner);

  // Returns true iff some reader holds the read lock.
  bool is_reading() const noexcept;

  // Returns true iff |owner| holds the read lock.
  bool is_read_by(const void* owner) const noexcept;

  // Returns the topic's iterator.
  // PRECONDITION: the caller holds the read lock
  MessageIterator* iterator() const noexcept;

  // Records |offset| as the last consumed offset of |partition|.
  void set_consumed_offset(int32_t partition, int64_t offset);

  // Returns a snapshot of the last consumed offset of every partition.
  OffsetMap consumed_offsets() const;

 private:
  const std::string name_;
  const MessageIteratorPtr iter_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  const void* owner_;  // protected by mu_
  OffsetMap offsets_;  // protected by mu_
};

}  // namespace consumer

#endif  // CONSUMER_TOPIC_H

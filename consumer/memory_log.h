// consumer/memory_log.h - In-process append-only partitioned log
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CONSUMER_MEMORY_LOG_H
#define CONSUMER_MEMORY_LOG_H

#include <cstdint>
#include <memory>
#include <string>

#include "base/clock.h"
#include "base/duration.h"
#include "base/result.h"
#include "consumer/iterator.h"

namespace consumer {

namespace internal {
struct LogData;  // forward declaration
}  // namespace internal

// MemoryLog is a partitioned log held entirely in memory.
//
// Each topic has a fixed number of partitions; each partition is an
// append-only sequence of key/value records whose offsets start at 0.
// Iterators opened through |iterator_factory()| start at the beginning of
// every partition and visit partitions round-robin. An iterator with
// nothing to deliver blocks for up to |poll_timeout|, as measured by
// |clock|, waiting for an append.
//
// THREAD SAFETY: This class is thread-safe.
//
class MemoryLog {
 public:
  MemoryLog(base::Duration poll_timeout, base::MonotonicClock clock);
  explicit MemoryLog(base::Duration poll_timeout)
      : MemoryLog(poll_timeout, base::system_monotonic_clock()) {}
  ~MemoryLog() noexcept;

  // MemoryLogs are neither copyable nor moveable.
  MemoryLog(const MemoryLog&) = delete;
  MemoryLog(MemoryLog&&) = delete;
  MemoryLog& operator=(const MemoryLog&) = delete;
  MemoryLog& operator=(MemoryLog&&) = delete;

  // Creates a topic with |partitions| partitions.
  // - Returns INVALID_ARGUMENT if |partitions| is not positive
  // - Returns FAILED_PRECONDITION if the topic already exists
  base::Result create_topic(const std::string& topic, int32_t partitions);

  // Appends a record to |partition| of |topic|.
  // - Returns NOT_FOUND if the topic does not exist
  // - Returns OUT_OF_RANGE if the topic has no such partition
  //
  // On success, |*offset| (if provided) receives the new record's offset.
  //
  base::Result append(const std::string& topic, int32_t partition,
                      std::string key, std::string value,
                      int64_t* /*nullable*/ offset = nullptr);

  // Returns an IteratorFactory for use by a ConsumerState.
  // The factory and its iterators may outlive this MemoryLog.
  IteratorFactory iterator_factory() const;

 private:
  std::shared_ptr<internal::LogData> data_;
};

}  // namespace consumer

#endif  // CONSUMER_MEMORY_LOG_H

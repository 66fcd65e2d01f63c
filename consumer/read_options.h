// consumer/read_options.h - Tunables for budgeted consumer reads
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CONSUMER_READ_OPTIONS_H
#define CONSUMER_READ_OPTIONS_H

#include <cstddef>
#include <cstdint>

#include "base/duration.h"
#include "base/result.h"

namespace consumer {

// ReadOptions holds the limits applied to every read issued through one
// ConsumerState, plus the sizing of the ReadWorker that drives them.
class ReadOptions {
 public:
  static constexpr uint64_t kDefaultMaxResponseBytes = 64ULL << 20;
  static constexpr int64_t kDefaultRequestTimeoutMs = 1000;
  static constexpr int64_t kDefaultIteratorBackoffMs = 50;
  static constexpr int64_t kDefaultIteratorTimeoutMs = 1;
  static constexpr std::size_t kDefaultWorkerThreads = 1;

  // ReadOptions is default constructible, copyable, and moveable.
  // There is intentionally no constructor for aggregate initialization.
  ReadOptions() noexcept
      : max_response_bytes_(kDefaultMaxResponseBytes),
        request_timeout_(base::milliseconds(kDefaultRequestTimeoutMs)),
        iterator_backoff_(base::milliseconds(kDefaultIteratorBackoffMs)),
        iterator_timeout_(base::milliseconds(kDefaultIteratorTimeoutMs)),
        worker_threads_(kDefaultWorkerThreads) {}
  ReadOptions(const ReadOptions&) = default;
  ReadOptions(ReadOptions&&) = default;
  ReadOptions& operator=(const ReadOptions&) = default;
  ReadOptions& operator=(ReadOptions&&) noexcept = default;

  // Resets all fields to their default values.
  void reset() noexcept { *this = ReadOptions(); }

  // The |max_response_bytes()| value is the ceiling on the approximate size
  // of a single read's result. Callers may ask for less, never for more.
  uint64_t max_response_bytes() const noexcept { return max_response_bytes_; }
  void reset_max_response_bytes() noexcept {
    max_response_bytes_ = kDefaultMaxResponseBytes;
  }
  void set_max_response_bytes(uint64_t n) noexcept { max_response_bytes_ = n; }

  // The |request_timeout()| value is the overall deadline of a read, measured
  // from the moment the read was created.
  base::Duration request_timeout() const noexcept { return request_timeout_; }
  void reset_request_timeout() noexcept {
    request_timeout_ = base::milliseconds(kDefaultRequestTimeoutMs);
  }
  void set_request_timeout(base::Duration d) noexcept { request_timeout_ = d; }

  // The |iterator_backoff()| value is how long a read waits, measured from
  // the start of its previous step, after finding its topic empty.
  base::Duration iterator_backoff() const noexcept { return iterator_backoff_; }
  void reset_iterator_backoff() noexcept {
    iterator_backoff_ = base::milliseconds(kDefaultIteratorBackoffMs);
  }
  void set_iterator_backoff(base::Duration d) noexcept {
    iterator_backoff_ = d;
  }

  // The |iterator_timeout()| value is how long a MessageIterator may block
  // inside |peek()| before reporting UNAVAILABLE.
  base::Duration iterator_timeout() const noexcept { return iterator_timeout_; }
  void reset_iterator_timeout() noexcept {
    iterator_timeout_ = base::milliseconds(kDefaultIteratorTimeoutMs);
  }
  void set_iterator_timeout(base::Duration d) noexcept {
    iterator_timeout_ = d;
  }

  // The |worker_threads()| value is the number of ReadWorker threads.
  std::size_t worker_threads() const noexcept { return worker_threads_; }
  void reset_worker_threads() noexcept {
    worker_threads_ = kDefaultWorkerThreads;
  }
  void set_worker_threads(std::size_t n) noexcept { worker_threads_ = n; }

  // Checks that every field holds a usable value.
  // - Returns INVALID_ARGUMENT naming the first offending field
  base::Result validate() const;

 private:
  uint64_t max_response_bytes_;
  base::Duration request_timeout_;
  base::Duration iterator_backoff_;
  base::Duration iterator_timeout_;
  std::size_t worker_threads_;
};

}  // namespace consumer

#endif  // CONSUMER_READ_OPTIONS_H

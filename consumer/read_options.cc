// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "consumer/read_options.h"

namespace consumer {

constexpr uint64_t ReadOptions::kDefaultMaxResponseBytes;
constexpr int64_t ReadOptions::kDefaultRequestTimeoutMs;
constexpr int64_t ReadOptions::kDefaultIteratorBackoffMs;
constexpr int64_t ReadOptions::kDefaultIteratorTimeoutMs;
constexpr std::size_t ReadOptions::kDefaultWorkerThreads;

static base::Result positive(const char* name, base::Duration d) {
  if (d.is_neg() || d.is_zero()) {
    return base::Result::invalid_argument(name, " must be positive, got ", d);
  }
  return base::Result();
}

base::Result ReadOptions::validate() const {
  if (max_response_bytes_ == 0) {
    return base::Result::invalid_argument("max_response_bytes must be > 0");
  }
  if (worker_threads_ == 0) {
    return base::Result::invalid_argument("worker_threads must be > 0");
  }
  return positive("request_timeout", request_timeout_)
      .and_then(positive, "iterator_backoff", iterator_backoff_)
      .and_then(positive, "iterator_timeout", iterator_timeout_);
}

}  // namespace consumer

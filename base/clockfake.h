// base/clockfake.h - Fake MonotonicClockImpl for unit testing
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_CLOCKFAKE_H
#define BASE_CLOCKFAKE_H

#include <mutex>

#include "base/clock.h"
#include "base/mutex.h"

namespace base {

// FakeMonotonicClock only moves when the test moves it.
//
// THREAD SAFETY: This class is thread-safe.
//
class FakeMonotonicClock : public MonotonicClockImpl {
 public:
  // Constructs a monotonic clock at the given instant.
  explicit FakeMonotonicClock(MonotonicTime now) noexcept : now_(now) {}

  // Constructs a monotonic clock 1000 seconds past the epoch.
  FakeMonotonicClock() noexcept
      : FakeMonotonicClock(MonotonicTime::from_epoch(seconds(1000))) {}

  // Returns the clock's current time.
  MonotonicTime now() const noexcept override {
    auto lock = acquire_lock(mu_);
    return now_;
  }

  // Advances the clock's current time by |dur|.
  void add(Duration dur) noexcept {
    auto lock = acquire_lock(mu_);
    now_ += dur;
  }

  // Returns a non-owning MonotonicClock handle.
  // PRECONDITION: this FakeMonotonicClock outlives every copy of the handle
  operator MonotonicClock() const noexcept {
    auto noop_deleter = [](const void*) {};
    return MonotonicClock(
        std::shared_ptr<const MonotonicClockImpl>(this, noop_deleter));
  }

 private:
  mutable std::mutex mu_;
  MonotonicTime now_;
};

}  // namespace base

#endif  // BASE_CLOCKFAKE_H

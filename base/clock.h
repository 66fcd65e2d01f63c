// base/clock.h - Interface for obtaining base::MonotonicTime values
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_CLOCK_H
#define BASE_CLOCK_H

#include <memory>

#include "base/time.h"

namespace base {

// MonotonicClockImpl is the abstract base class for MonotonicClocks.
// It is exposed mostly for use by unit tests.
class MonotonicClockImpl {
 protected:
  MonotonicClockImpl() noexcept = default;

 public:
  // MonotonicClockImpls are neither copyable nor moveable.
  MonotonicClockImpl(const MonotonicClockImpl&) = delete;
  MonotonicClockImpl(MonotonicClockImpl&&) = delete;
  MonotonicClockImpl& operator=(const MonotonicClockImpl&) = delete;
  MonotonicClockImpl& operator=(MonotonicClockImpl&&) = delete;

  virtual ~MonotonicClockImpl() noexcept = default;

  // Obtains the current monotonic time.
  //
  // THREAD SAFETY: This method MUST be thread-safe.
  //
  virtual MonotonicTime now() const = 0;
};

// MonotonicClock is a cheaply copyable handle to a MonotonicClockImpl.
class MonotonicClock {
 public:
  // MonotonicClocks are normally constructed from an implementation.
  MonotonicClock(std::shared_ptr<const MonotonicClockImpl> ptr) noexcept
      : ptr_(std::move(ptr)) {}

  // MonotonicClocks are default constructible, copyable, and moveable.
  MonotonicClock() noexcept = default;
  MonotonicClock(const MonotonicClock&) noexcept = default;
  MonotonicClock(MonotonicClock&&) noexcept = default;
  MonotonicClock& operator=(const MonotonicClock&) noexcept = default;
  MonotonicClock& operator=(MonotonicClock&&) noexcept = default;

  // A valid MonotonicClock is one that has an implementation.
  explicit operator bool() const noexcept { return !!ptr_; }
  void assert_valid() const;

  // Obtains the current monotonic time.
  //
  // THREAD SAFETY: This method is thread-safe.
  //
  MonotonicTime now() const {
    assert_valid();
    return ptr_->now();
  }

 private:
  std::shared_ptr<const MonotonicClockImpl> ptr_;
};

// Returns a shared MonotonicClock that returns monotonically increasing times.
//
// The epoch is unspecified, and it may change across application restarts.
// Use this clock for measuring the duration between times.
//
// THREAD SAFETY: This function is thread-safe.
//
MonotonicClock system_monotonic_clock();

// Convenience method for obtaining the current system monotonic time.
inline MonotonicTime monotonic_now() { return system_monotonic_clock().now(); }

// Replaces the shared MonotonicClock.
// This function should only be used in unit tests.
//
// THREAD SAFETY: This function is thread-safe.
//
void set_system_monotonic_clock(MonotonicClock clock);

}  // namespace base

#endif  // BASE_CLOCK_H

// base/time.h - Value type representing an instant on a monotonic clock
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_TIME_H
#define BASE_TIME_H

#include <ostream>
#include <string>

#include "base/duration.h"

namespace base {

// MonotonicTime represents an instant of time on a monotonic clock.
//
// - It is guaranteed to have nanosecond precision.
//
// - It is NOT guaranteed to have any particular epoch.
//   ~ It is NOT guaranteed to have the same epoch across application restarts.
//   ~ In particular, the monotonic clock's epoch may be something as arbitrary
//     as "time since last reboot".
//
class MonotonicTime {
 private:
  explicit constexpr MonotonicTime(Duration d) noexcept : d_(d) {}

 public:
  // MonotonicTime is default constructible, copyable, and moveable.
  constexpr MonotonicTime() noexcept : d_() {}
  constexpr MonotonicTime(const MonotonicTime&) noexcept = default;
  MonotonicTime& operator=(const MonotonicTime&) noexcept = default;

  // Constructs a MonotonicTime in terms of the Duration since the epoch.
  static constexpr MonotonicTime from_epoch(Duration d) noexcept {
    return MonotonicTime(d);
  }

  // Returns the MonotonicTime as a Duration since the epoch.
  constexpr Duration since_epoch() const noexcept { return d_; }

  // Returns true iff this MonotonicTime represents the epoch itself.
  constexpr bool is_epoch() const noexcept { return d_.is_zero(); }

  MonotonicTime& operator+=(Duration b) noexcept {
    d_ += b;
    return *this;
  }
  MonotonicTime& operator-=(Duration b) noexcept {
    d_ -= b;
    return *this;
  }

  void append_to(std::string* out) const;
  std::string as_string() const;

 private:
  Duration d_;
};

// Comparison operators {{{

inline constexpr bool operator==(MonotonicTime a, MonotonicTime b) noexcept {
  return a.since_epoch() == b.since_epoch();
}
inline constexpr bool operator!=(MonotonicTime a, MonotonicTime b) noexcept {
  return !(a == b);
}
inline constexpr bool operator<(MonotonicTime a, MonotonicTime b) noexcept {
  return a.since_epoch() < b.since_epoch();
}
inline constexpr bool operator>(MonotonicTime a, MonotonicTime b) noexcept {
  return (b < a);
}
inline constexpr bool operator<=(MonotonicTime a, MonotonicTime b) noexcept {
  return !(b < a);
}
inline constexpr bool operator>=(MonotonicTime a, MonotonicTime b) noexcept {
  return !(a < b);
}

// }}}
// Arithmetic operators {{{

inline constexpr MonotonicTime operator+(MonotonicTime a, Duration b) {
  return MonotonicTime::from_epoch(a.since_epoch() + b);
}
inline constexpr MonotonicTime operator-(MonotonicTime a, Duration b) {
  return MonotonicTime::from_epoch(a.since_epoch() - b);
}
inline constexpr Duration operator-(MonotonicTime a, MonotonicTime b) {
  return a.since_epoch() - b.since_epoch();
}

// }}}

inline std::ostream& operator<<(std::ostream& os, MonotonicTime t) {
  return (os << t.as_string());
}

}  // namespace base

#endif  // BASE_TIME_H

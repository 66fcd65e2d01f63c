// base/duration.h - Value type representing a span of time
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_DURATION_H
#define BASE_DURATION_H

#include <chrono>
#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>

namespace base {

namespace internal {

static constexpr int64_t NS_PER_US = 1000;
static constexpr int64_t NS_PER_MS = 1000000;
static constexpr int64_t NS_PER_S = 1000000000;

inline constexpr int64_t safe_scale(int64_t x, int64_t k) {
  return (x > std::numeric_limits<int64_t>::max() / k ||
          x < std::numeric_limits<int64_t>::min() / k)
             ? (throw std::overflow_error("base::Duration out of range"), 0)
             : x * k;
}

}  // namespace internal

// Duration represents the width of a span of time.
// - It is guaranteed to have nanosecond precision.
// - It has a range of roughly +/- 292 years.
class Duration {
 private:
  explicit constexpr Duration(int64_t ns) noexcept : ns_(ns) {}

 public:
  // Duration is default constructible, copyable, and moveable.
  constexpr Duration() noexcept : ns_(0) {}
  constexpr Duration(const Duration&) noexcept = default;
  Duration& operator=(const Duration&) noexcept = default;

  // Constructs a Duration from a raw count of nanoseconds.
  static constexpr Duration from_raw(int64_t ns) noexcept {
    return Duration(ns);
  }

  // Returns true iff this is the zero Duration.
  constexpr bool is_zero() const noexcept { return ns_ == 0; }

  // Returns true iff this Duration is less than the zero Duration.
  constexpr bool is_neg() const noexcept { return ns_ < 0; }

  // Comparison operators {{{

  friend constexpr bool operator==(Duration a, Duration b) noexcept {
    return a.ns_ == b.ns_;
  }
  friend constexpr bool operator!=(Duration a, Duration b) noexcept {
    return a.ns_ != b.ns_;
  }
  friend constexpr bool operator<(Duration a, Duration b) noexcept {
    return a.ns_ < b.ns_;
  }
  friend constexpr bool operator>(Duration a, Duration b) noexcept {
    return b.ns_ < a.ns_;
  }
  friend constexpr bool operator<=(Duration a, Duration b) noexcept {
    return !(b.ns_ < a.ns_);
  }
  friend constexpr bool operator>=(Duration a, Duration b) noexcept {
    return !(a.ns_ < b.ns_);
  }

  // }}}
  // Arithmetic operators {{{

  constexpr Duration operator-() const noexcept { return Duration(-ns_); }

  friend constexpr Duration operator+(Duration a, Duration b) noexcept {
    return Duration(a.ns_ + b.ns_);
  }
  friend constexpr Duration operator-(Duration a, Duration b) noexcept {
    return Duration(a.ns_ - b.ns_);
  }
  friend constexpr Duration operator*(Duration a, int64_t b) {
    return Duration(internal::safe_scale(a.ns_, b));
  }

  Duration& operator+=(Duration b) noexcept { return (*this = (*this + b)); }
  Duration& operator-=(Duration b) noexcept { return (*this = (*this - b)); }

  // }}}

  constexpr int64_t nanoseconds() const noexcept { return ns_; }
  constexpr int64_t microseconds() const noexcept {
    return ns_ / internal::NS_PER_US;
  }
  constexpr int64_t milliseconds() const noexcept {
    return ns_ / internal::NS_PER_MS;
  }
  constexpr int64_t seconds() const noexcept {
    return ns_ / internal::NS_PER_S;
  }

  // Converts to a std::chrono duration, for waiting on condition variables.
  // Negative Durations clamp to zero.
  std::chrono::nanoseconds to_chrono() const noexcept {
    return std::chrono::nanoseconds(ns_ < 0 ? 0 : ns_);
  }

  // Formats in the largest unit that represents it exactly,
  // e.g. "2s", "1500ms", "0s", "-20us".
  void append_to(std::string* out) const;
  std::string as_string() const;

 private:
  int64_t ns_;
};

inline std::ostream& operator<<(std::ostream& os, Duration d) {
  return (os << d.as_string());
}

// Constructors for Duration {{{

constexpr Duration nanoseconds(int64_t ns) { return Duration::from_raw(ns); }

constexpr Duration microseconds(int64_t us) {
  return Duration::from_raw(internal::safe_scale(us, internal::NS_PER_US));
}

constexpr Duration milliseconds(int64_t ms) {
  return Duration::from_raw(internal::safe_scale(ms, internal::NS_PER_MS));
}

constexpr Duration seconds(int64_t s) {
  return Duration::from_raw(internal::safe_scale(s, internal::NS_PER_S));
}

// }}}

}  // namespace base

#endif  // BASE_DURATION_H

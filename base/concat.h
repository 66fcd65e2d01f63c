// base/concat.h - Stringify and concatenate heterogeneous values
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_CONCAT_H
#define BASE_CONCAT_H

#include <sstream>
#include <string>

namespace base {

namespace internal {

inline void concat_stream(std::ostringstream& ss) {}

template <typename T, typename... Rest>
void concat_stream(std::ostringstream& ss, const T& first,
                   const Rest&... rest) {
  ss << first;
  concat_stream(ss, rest...);
}

}  // namespace internal

// Stringifies each argument with operator<< and appends the results to |out|.
//
// Typical usage:
//
//    std::string str = "offset=";
//    base::concat_to(&str, 42, " partition=", 3);
//
template <typename... Args>
void concat_to(std::string* out, const Args&... args) {
  std::ostringstream ss;
  internal::concat_stream(ss, args...);
  out->append(ss.str());
}

// Stringifies each argument with operator<< and returns the concatenation.
template <typename... Args>
std::string concat(const Args&... args) {
  std::string out;
  concat_to(&out, args...);
  return out;
}

}  // namespace base

#endif  // BASE_CONCAT_H

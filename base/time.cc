// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/time.h"

#include "base/concat.h"

namespace base {

void MonotonicTime::append_to(std::string* out) const {
  concat_to(out, "MonotonicTime(", d_, ")");
}

std::string MonotonicTime::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

}  // namespace base

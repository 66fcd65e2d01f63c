// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/duration.h"

#include "base/concat.h"

using namespace base::internal;

namespace base {

void Duration::append_to(std::string* out) const {
  if (ns_ == 0) {
    out->append("0s");
  } else if (ns_ % NS_PER_S == 0) {
    concat_to(out, ns_ / NS_PER_S, "s");
  } else if (ns_ % NS_PER_MS == 0) {
    concat_to(out, ns_ / NS_PER_MS, "ms");
  } else if (ns_ % NS_PER_US == 0) {
    concat_to(out, ns_ / NS_PER_US, "us");
  } else {
    concat_to(out, ns_, "ns");
  }
}

std::string Duration::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

}  // namespace base

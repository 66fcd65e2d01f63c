// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "encoding/base64.h"

#include <cstdint>

namespace encoding {

static uint32_t byte_at(const std::string& src, std::size_t i) {
  return static_cast<uint8_t>(src[i]);
}

std::size_t encoded_length(Base64 b64, std::size_t len) noexcept {
  std::size_t sum = (len / 3) * 4;
  len %= 3;
  if (len) {
    if (b64.pad) {
      sum += 4;
    } else {
      sum += len + 1;
    }
  }
  return sum;
}

void encode_to(Base64 b64, std::string* out, const std::string& src) {
  out->reserve(out->size() + encoded_length(b64, src.size()));

  std::size_t i = 0;
  std::size_t n = (src.size() / 3) * 3;
  while (i < n) {
    uint32_t word = (byte_at(src, i) << 16) | (byte_at(src, i + 1) << 8) |
                    byte_at(src, i + 2);
    out->push_back(b64.charset[(word >> 18) & 63]);
    out->push_back(b64.charset[(word >> 12) & 63]);
    out->push_back(b64.charset[(word >> 6) & 63]);
    out->push_back(b64.charset[word & 63]);
    i += 3;
  }

  std::size_t remaining = src.size() - i;
  if (remaining == 2) {
    uint32_t word = (byte_at(src, i) << 16) | (byte_at(src, i + 1) << 8);
    out->push_back(b64.charset[(word >> 18) & 63]);
    out->push_back(b64.charset[(word >> 12) & 63]);
    out->push_back(b64.charset[(word >> 6) & 63]);
    if (b64.pad) out->push_back(b64.charset[64]);
  } else if (remaining == 1) {
    uint32_t word = (byte_at(src, i) << 16);
    out->push_back(b64.charset[(word >> 18) & 63]);
    out->push_back(b64.charset[(word >> 12) & 63]);
    if (b64.pad) out->append(2, b64.charset[64]);
  }
}

std::string encode(Base64 b64, const std::string& src) {
  std::string out;
  encode_to(b64, &out, src);
  return out;
}

}  // namespace encoding

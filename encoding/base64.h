// encoding/base64.h - Encode helpers for base-64 data
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef ENCODING_BASE64_H
#define ENCODING_BASE64_H

#include <cstddef>
#include <string>

namespace encoding {

struct Base64 {
  const char* charset;
  bool pad;

  constexpr Base64(const char* cs, bool p) noexcept : charset(cs), pad(p) {}
};

constexpr char B64_STANDARD_CHARSET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/=";

constexpr char B64_URLSAFE_CHARSET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_=";

// Encoder modes {{{

constexpr Base64 BASE64 = {B64_STANDARD_CHARSET, true};
constexpr Base64 BASE64_NOPAD = {B64_STANDARD_CHARSET, false};
constexpr Base64 BASE64_URLSAFE = {B64_URLSAFE_CHARSET, true};

// }}}

// Returns the number of characters needed to encode |len| bytes as base-64.
std::size_t encoded_length(Base64 b64, std::size_t len) noexcept;

// Encodes the bytes in |src| as base-64 and appends them to |out|.
void encode_to(Base64 b64, std::string* out, const std::string& src);

// Encodes the bytes in |src| as base-64 and returns the result.
std::string encode(Base64 b64, const std::string& src);

}  // namespace encoding

#endif  // ENCODING_BASE64_H

// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "encoding/base64.h"
#include "gtest/gtest.h"

TEST(Base64, Encode) {
  EXPECT_EQ("", encode(encoding::BASE64, ""));
  EXPECT_EQ("a2V5LTE=", encode(encoding::BASE64, "key-1"));
  EXPECT_EQ("dmFsdWU=", encode(encoding::BASE64, "value"));
  EXPECT_EQ("b2Zmc2V0IDQy", encode(encoding::BASE64, "offset 42"));
  EXPECT_EQ("cGFydGl0aW9uIDA=", encode(encoding::BASE64, "partition 0"));
  EXPECT_EQ("AA==", encode(encoding::BASE64, std::string(1, '\0')));

  EXPECT_EQ("a2V5LTE", encode(encoding::BASE64_NOPAD, "key-1"));
  EXPECT_EQ("cGFydGl0aW9uIDA", encode(encoding::BASE64_NOPAD, "partition 0"));
}

TEST(Base64, BinaryCharset) {
  std::string raw("\xfb\xff\xfe", 3);
  EXPECT_EQ("+//+", encode(encoding::BASE64, raw));
  EXPECT_EQ("-__-", encode(encoding::BASE64_URLSAFE, raw));
}

TEST(Base64, AppendAndLength) {
  std::string out = "value=";
  encoding::encode_to(encoding::BASE64, &out, "hi");
  EXPECT_EQ("value=aGk=", out);

  EXPECT_EQ(0U, encoded_length(encoding::BASE64, 0));
  EXPECT_EQ(4U, encoded_length(encoding::BASE64, 1));
  EXPECT_EQ(2U, encoded_length(encoding::BASE64_NOPAD, 1));
  EXPECT_EQ(3U, encoded_length(encoding::BASE64_NOPAD, 2));
  EXPECT_EQ(8U, encoded_length(encoding::BASE64, 6));
}

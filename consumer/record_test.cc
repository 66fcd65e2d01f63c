// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include "consumer/record.h"

TEST(Record, Binary) {
  auto translate = consumer::make_translator(consumer::RecordFormat::binary);
  consumer::RawRecord raw("events", 3, 42, "key-1", "value");
  consumer::TranslatedRecord tr = translate(raw);
  EXPECT_EQ(consumer::ClientRecord("a2V5LTE=", "dmFsdWU=", 3, 42), tr.record);
  EXPECT_EQ(10U, tr.size);
}

TEST(Record, Raw) {
  auto translate = consumer::make_translator(consumer::RecordFormat::raw);
  consumer::RawRecord raw("events", 0, 7, "", "payload");
  consumer::TranslatedRecord tr = translate(raw);
  EXPECT_EQ(consumer::ClientRecord("", "payload", 0, 7), tr.record);
  EXPECT_EQ(7U, tr.size);
}

TEST(Record, SizeIgnoresRendering) {
  consumer::RawRecord raw("events", 1, 1, std::string(30, 'k'),
                          std::string(70, 'v'));
  auto bin = consumer::make_translator(consumer::RecordFormat::binary)(raw);
  auto plain = consumer::make_translator(consumer::RecordFormat::raw)(raw);
  EXPECT_EQ(100U, consumer::approximate_size(raw));
  EXPECT_EQ(100U, bin.size);
  EXPECT_EQ(100U, plain.size);
  EXPECT_LT(plain.record.value.size(), bin.record.value.size());
}

TEST(Record, AsString) {
  consumer::ClientRecord rec("k", "v", 2, 9);
  EXPECT_EQ("ClientRecord{partition=2 offset=9 key=\"k\" value=\"v\"}",
            rec.as_string());
}

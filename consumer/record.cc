// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "consumer/record.h"

#include "base/concat.h"
#include "base/logging.h"
#include "encoding/base64.h"

namespace consumer {

void ClientRecord::append_to(std::string* out) const {
  base::concat_to(out, "ClientRecord{partition=", partition,
                  " offset=", offset, " key=\"", key, "\" value=\"", value,
                  "\"}");
}

std::string ClientRecord::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

static TranslatedRecord translate_binary(const RawRecord& raw) {
  ClientRecord rec(encoding::encode(encoding::BASE64, raw.key),
                   encoding::encode(encoding::BASE64, raw.value),
                   raw.partition, raw.offset);
  return TranslatedRecord(std::move(rec), approximate_size(raw));
}

static TranslatedRecord translate_raw(const RawRecord& raw) {
  ClientRecord rec(raw.key, raw.value, raw.partition, raw.offset);
  return TranslatedRecord(std::move(rec), approximate_size(raw));
}

RecordTranslator make_translator(RecordFormat format) {
  switch (format) {
    case RecordFormat::binary:
      return translate_binary;

    case RecordFormat::raw:
      return translate_raw;
  }
  LOG(DFATAL) << "BUG! unknown RecordFormat "
              << static_cast<unsigned int>(format);
  return translate_raw;
}

}  // namespace consumer

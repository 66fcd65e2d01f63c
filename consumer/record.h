// consumer/record.h - Records as read from a topic and as handed to clients
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CONSUMER_RECORD_H
#define CONSUMER_RECORD_H

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace consumer {

// RawRecord is a record exactly as a MessageIterator yields it.
struct RawRecord {
  std::string topic;
  int32_t partition;
  int64_t offset;
  std::string key;
  std::string value;

  RawRecord() noexcept : partition(0), offset(0) {}
  RawRecord(std::string t, int32_t p, int64_t o, std::string k, std::string v)
      : topic(std::move(t)),
        partition(p),
        offset(o),
        key(std::move(k)),
        value(std::move(v)) {}
};

// ClientRecord is a record rendered for the client that asked for it.
struct ClientRecord {
  std::string key;
  std::string value;
  int32_t partition;
  int64_t offset;

  ClientRecord() noexcept : partition(0), offset(0) {}
  ClientRecord(std::string k, std::string v, int32_t p, int64_t o)
      : key(std::move(k)), value(std::move(v)), partition(p), offset(o) {}

  void append_to(std::string* out) const;
  std::string as_string() const;
};

inline bool operator==(const ClientRecord& a, const ClientRecord& b) {
  return a.partition == b.partition && a.offset == b.offset &&
         a.key == b.key && a.value == b.value;
}
inline bool operator!=(const ClientRecord& a, const ClientRecord& b) {
  return !(a == b);
}

inline std::ostream& operator<<(std::ostream& os, const ClientRecord& r) {
  return (os << r.as_string());
}

using Records = std::vector<ClientRecord>;

// TranslatedRecord pairs a ClientRecord with the approximate number of bytes
// it charges against a read's budget.
struct TranslatedRecord {
  ClientRecord record;
  uint64_t size;

  TranslatedRecord() noexcept : size(0) {}
  TranslatedRecord(ClientRecord r, uint64_t s) noexcept
      : record(std::move(r)),
        size(s) {}
};

// A RecordTranslator renders a RawRecord for the client.
// It may throw; a throwing translator ends the read that invoked it.
using RecordTranslator = std::function<TranslatedRecord(const RawRecord&)>;

// RecordFormat selects one of the built-in RecordTranslators.
enum class RecordFormat : uint8_t {
  // Key and value are rendered as padded standard base-64.
  binary = 0,

  // Key and value are passed through untouched.
  raw = 1,
};

// Returns the approximate size of |raw|: the sum of its key and value sizes.
// The size does not depend on how the record is rendered.
inline uint64_t approximate_size(const RawRecord& raw) noexcept {
  return raw.key.size() + raw.value.size();
}

// Returns the built-in RecordTranslator for |format|.
RecordTranslator make_translator(RecordFormat format);

}  // namespace consumer

#endif  // CONSUMER_RECORD_H

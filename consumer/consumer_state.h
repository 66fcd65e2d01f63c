// consumer/consumer_state.h - One consumer instance and its topics
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CONSUMER_CONSUMER_STATE_H
#define CONSUMER_CONSUMER_STATE_H

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "base/clock.h"
#include "base/result.h"
#include "consumer/iterator.h"
#include "consumer/read_options.h"
#include "consumer/record.h"
#include "consumer/topic.h"

namespace consumer {

// ConsumerState ties together everything a ReadTask needs from its consumer:
// the read limits, a clock, the record translator, and one TopicState per
// topic that has been read.
//
// THREAD SAFETY: This class is thread-safe.
//
class ConsumerState {
 public:
  // Maximum length of a topic name.
  static constexpr std::size_t kMaxTopicNameLength = 249;

  ConsumerState(ReadOptions opts, base::MonotonicClock clock,
                RecordTranslator translator, IteratorFactory factory);
  ~ConsumerState() noexcept;

  // ConsumerStates are neither copyable nor moveable.
  ConsumerState(const ConsumerState&) = delete;
  ConsumerState(ConsumerState&&) = delete;
  ConsumerState& operator=(const ConsumerState&) = delete;
  ConsumerState& operator=(ConsumerState&&) = delete;

  const ReadOptions& options() const noexcept { return opts_; }
  const base::MonotonicClock& clock() const noexcept { return clock_; }
  base::MonotonicTime now() const { return clock_.now(); }

  // Resolves |topic| to its TopicState, opening an iterator on first use.
  // - Returns INVALID_ARGUMENT if |topic| is not a legal topic name
  // - Returns NOT_FOUND if the topic does not exist
  // - Returns FAILED_PRECONDITION if this consumer has been closed
  //
  // On success, |*out| remains valid until |close()| or destruction.
  //
  base::Result get_or_create_topic_state(const std::string& topic,
                                         TopicState** out);

  // Bracket one reader's exclusive use of |ts|'s iterator.
  // |owner| identifies the reader; see TopicState.
  void start_read(TopicState* ts, const void* owner) { ts->start_read(owner); }
  bool try_start_read(TopicState* ts, const void* owner) {
    return ts->try_start_read(owner);
  }
  void finish_read(TopicState* ts, const void* owner) {
    ts->finish_read(owner);
  }

  // Renders |raw| for the client with the configured translator.
  TranslatedRecord translate(const RawRecord& raw) const {
    return translator_(raw);
  }

  // Returns topic -> partition -> last consumed offset, for every topic.
  std::map<std::string, OffsetMap> consumed_offsets() const;

  // Forgets every TopicState. Later resolutions fail.
  // PRECONDITION: no read is in progress
  void close();

  // Returns true iff |topic| is a legal topic name.
  static bool is_valid_topic_name(const std::string& topic);

 private:
  using TopicMap = std::map<std::string, std::unique_ptr<TopicState>>;

  const ReadOptions opts_;
  const base::MonotonicClock clock_;
  const RecordTranslator translator_;
  const IteratorFactory factory_;
  mutable std::mutex mu_;
  TopicMap topics_;  // protected by mu_
  bool closed_;      // protected by mu_
};

}  // namespace consumer

#endif  // CONSUMER_CONSUMER_STATE_H

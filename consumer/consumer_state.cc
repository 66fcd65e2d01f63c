// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "consumer/consumer_state.h"

#include "base/logging.h"
#include "base/mutex.h"
#include "re2/re2.h"

namespace consumer {

constexpr std::size_t ConsumerState::kMaxTopicNameLength;

static const re2::RE2& topic_name_regexp() {
  static const auto& ref = *new re2::RE2("[a-zA-Z0-9._-]+");
  return ref;
}

ConsumerState::ConsumerState(ReadOptions opts, base::MonotonicClock clock,
                             RecordTranslator translator,
                             IteratorFactory factory)
    : opts_(std::move(opts)),
      clock_(std::move(clock)),
      translator_(std::move(translator)),
      factory_(std::move(factory)),
      closed_(false) {
  CHECK_OK(opts_.validate());
  clock_.assert_valid();
  CHECK(translator_) << ": consumer::ConsumerState requires a translator";
  CHECK(factory_) << ": consumer::ConsumerState requires an iterator factory";
}

ConsumerState::~ConsumerState() noexcept {
  auto lock = base::acquire_lock(mu_);
  for (const auto& pair : topics_) {
    if (pair.second->is_reading()) {
      LOG(DFATAL) << "BUG! consumer::ConsumerState: destroyed while "
                  << "topic \"" << pair.first << "\" is being read";
    }
  }
}

bool ConsumerState::is_valid_topic_name(const std::string& topic) {
  if (topic.size() > kMaxTopicNameLength) return false;
  if (topic == "." || topic == "..") return false;
  return re2::RE2::FullMatch(topic, topic_name_regexp());
}

base::Result ConsumerState::get_or_create_topic_state(const std::string& topic,
                                                      TopicState** out) {
  CHECK_NOTNULL(out);
  *out = nullptr;

  if (!is_valid_topic_name(topic)) {
    return base::Result::invalid_argument("illegal topic name \"", topic,
                                          "\"");
  }

  auto lock = base::acquire_lock(mu_);
  if (closed_) {
    return base::Result::failed_precondition("consumer is closed");
  }

  auto it = topics_.find(topic);
  if (it != topics_.end()) {
    *out = it->second.get();
    return base::Result();
  }

  MessageIteratorPtr iter;
  base::Result r = factory_(topic, &iter);
  if (!r) return r;
  if (!iter) {
    return base::Result::internal("no iterator for topic \"", topic, "\"");
  }

  std::unique_ptr<TopicState> ts(new TopicState(topic, std::move(iter)));
  *out = ts.get();
  topics_.emplace(topic, std::move(ts));
  VLOG(1) << "consumer::ConsumerState: opened topic \"" << topic << "\"";
  return base::Result();
}

std::map<std::string, OffsetMap> ConsumerState::consumed_offsets() const {
  std::map<std::string, OffsetMap> out;
  auto lock = base::acquire_lock(mu_);
  for (const auto& pair : topics_) {
    OffsetMap offsets = pair.second->consumed_offsets();
    if (!offsets.empty()) out.emplace(pair.first, std::move(offsets));
  }
  return out;
}

void ConsumerState::close() {
  auto lock = base::acquire_lock(mu_);
  for (const auto& pair : topics_) {
    CHECK(!pair.second->is_reading())
        << ": topic \"" << pair.first << "\" is being read";
  }
  closed_ = true;
  topics_.clear();
}

}  // namespace consumer

// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "consumer/memory_log.h"

#include <condition_variable>
#include <map>
#include <mutex>
#include <vector>

#include "base/logging.h"
#include "base/mutex.h"

namespace consumer {

namespace internal {

struct StoredRecord {
  std::string key;
  std::string value;

  StoredRecord(std::string k, std::string v)
      : key(std::move(k)), value(std::move(v)) {}
};

using Partition = std::vector<StoredRecord>;

struct LogTopic {
  std::vector<Partition> partitions;

  explicit LogTopic(int32_t n) : partitions(n) {}
};

struct LogData {
  const base::Duration poll_timeout;
  const base::MonotonicClock clock;
  std::mutex mu;
  std::condition_variable cv;
  std::map<std::string, std::unique_ptr<LogTopic>> topics;  // protected by mu

  LogData(base::Duration d, base::MonotonicClock c)
      : poll_timeout(d), clock(std::move(c)) {}
};

}  // namespace internal

namespace {

class MemoryLogIterator : public MessageIterator {
 public:
  MemoryLogIterator(std::shared_ptr<internal::LogData> data, std::string name,
                    const internal::LogTopic* topic)
      : data_(std::move(data)),
        name_(std::move(name)),
        topic_(topic),
        next_(topic->partitions.size(), 0),
        cursor_(0),
        peeked_(false) {}

  base::Result peek(RawRecord* out) override {
    auto lock = base::acquire_lock(data_->mu);
    const base::MonotonicTime deadline =
        data_->clock.now() + data_->poll_timeout;
    while (!peeked_ && !find_next()) {
      base::Duration remaining = deadline - data_->clock.now();
      if (remaining <= base::Duration()) return base::Result::unavailable();
      data_->cv.wait_for(lock, remaining.to_chrono());
    }
    *out = current_;
    return base::Result();
  }

  base::Result advance() override {
    auto lock = base::acquire_lock(data_->mu);
    if (!peeked_) {
      return base::Result::failed_precondition("advance() without peek()");
    }
    std::size_t p = static_cast<std::size_t>(current_.partition);
    ++next_[p];
    cursor_ = (p + 1) % next_.size();
    peeked_ = false;
    return base::Result();
  }

 private:
  // Looks for the next undelivered record, starting at |cursor_|.
  // data_->mu must be held.
  bool find_next() {
    const std::size_t n = next_.size();
    for (std::size_t i = 0; i < n; ++i) {
      std::size_t p = (cursor_ + i) % n;
      const internal::Partition& part = topic_->partitions[p];
      int64_t offset = next_[p];
      if (static_cast<std::size_t>(offset) < part.size()) {
        const internal::StoredRecord& entry = part[offset];
        current_ = RawRecord(name_, static_cast<int32_t>(p), offset,
                             entry.key, entry.value);
        peeked_ = true;
        return true;
      }
    }
    return false;
  }

  const std::shared_ptr<internal::LogData> data_;
  const std::string name_;
  const internal::LogTopic* const topic_;
  std::vector<int64_t> next_;
  std::size_t cursor_;
  bool peeked_;
  RawRecord current_;
};

}  // anonymous namespace

MemoryLog::MemoryLog(base::Duration poll_timeout, base::MonotonicClock clock)
    : data_(std::make_shared<internal::LogData>(poll_timeout,
                                                 std::move(clock))) {}

MemoryLog::~MemoryLog() noexcept = default;

base::Result MemoryLog::create_topic(const std::string& topic,
                                     int32_t partitions) {
  if (partitions <= 0) {
    return base::Result::invalid_argument("topic \"", topic,
                                          "\" needs at least one partition");
  }
  auto lock = base::acquire_lock(data_->mu);
  auto& slot = data_->topics[topic];
  if (slot) {
    return base::Result::failed_precondition("topic \"", topic,
                                             "\" already exists");
  }
  slot.reset(new internal::LogTopic(partitions));
  VLOG(1) << "consumer::MemoryLog: created topic \"" << topic << "\" with "
          << partitions << " partitions";
  return base::Result();
}

base::Result MemoryLog::append(const std::string& topic, int32_t partition,
                               std::string key, std::string value,
                               int64_t* offset) {
  auto lock = base::acquire_lock(data_->mu);
  auto it = data_->topics.find(topic);
  if (it == data_->topics.end()) {
    return base::Result::not_found("no such topic \"", topic, "\"");
  }
  auto& parts = it->second->partitions;
  if (partition < 0 || static_cast<std::size_t>(partition) >= parts.size()) {
    return base::Result::out_of_range("topic \"", topic, "\" has no partition ",
                                      partition);
  }
  auto& part = parts[partition];
  part.emplace_back(std::move(key), std::move(value));
  if (offset) *offset = static_cast<int64_t>(part.size()) - 1;
  lock.unlock();
  data_->cv.notify_all();
  return base::Result();
}

IteratorFactory MemoryLog::iterator_factory() const {
  auto data = data_;
  return [data](const std::string& topic,
                MessageIteratorPtr* out) -> base::Result {
    auto lock = base::acquire_lock(data->mu);
    auto it = data->topics.find(topic);
    if (it == data->topics.end()) {
      return base::Result::not_found("no such topic \"", topic, "\"");
    }
    out->reset(new MemoryLogIterator(data, topic, it->second.get()));
    return base::Result();
  };
}

}  // namespace consumer

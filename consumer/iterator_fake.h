// consumer/iterator_fake.h - Scripted MessageIterator for unit testing
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CONSUMER_ITERATOR_FAKE_H
#define CONSUMER_ITERATOR_FAKE_H

#include <deque>
#include <stdexcept>
#include <string>

#include "base/clockfake.h"
#include "base/logging.h"
#include "consumer/iterator.h"

namespace consumer {

// FakeMessageIterator replays a script of records, empty polls, and failures.
//
// An empty poll advances the attached FakeMonotonicClock (if any) by its
// poll cost, standing in for the time a real iterator spends blocked. Once
// the script runs out, every peek is an empty poll costing |idle_cost()|.
//
// THREAD SAFETY: This class is NOT thread-safe.
//
class FakeMessageIterator : public MessageIterator {
 private:
  enum class Kind { record, empty, failure, exception };

  struct Item {
    Kind kind;
    RawRecord record;
    base::Duration cost;
    base::Result error;

    explicit Item(Kind k) : kind(k) {}
  };

 public:
  explicit FakeMessageIterator(base::FakeMonotonicClock* clock = nullptr)
      : clock_(clock), peeks_(0), advances_(0) {}

  void push_record(int32_t partition, int64_t offset, std::string key,
                   std::string value) {
    Item item(Kind::record);
    item.record = RawRecord("", partition, offset, std::move(key),
                            std::move(value));
    script_.push_back(std::move(item));
  }

  // Pushes a record whose key is empty and whose value is |size| bytes long.
  void push_sized(int32_t partition, int64_t offset, std::size_t size) {
    push_record(partition, offset, "", std::string(size, 'x'));
  }

  void push_empty(base::Duration cost = base::Duration()) {
    Item item(Kind::empty);
    item.cost = cost;
    script_.push_back(std::move(item));
  }

  // The failure is sticky: every later peek reports it again.
  void push_failure(base::Result error) {
    Item item(Kind::failure);
    item.error = std::move(error);
    script_.push_back(std::move(item));
  }

  void push_exception() { script_.push_back(Item(Kind::exception)); }

  base::Duration idle_cost() const noexcept { return idle_cost_; }
  void set_idle_cost(base::Duration d) noexcept { idle_cost_ = d; }

  std::size_t peeks() const noexcept { return peeks_; }
  std::size_t advances() const noexcept { return advances_; }
  std::size_t remaining() const noexcept { return script_.size(); }

  base::Result peek(RawRecord* out) override {
    ++peeks_;
    if (script_.empty()) return empty_poll(idle_cost_);
    Item& item = script_.front();
    switch (item.kind) {
      case Kind::record:
        *out = item.record;
        return base::Result();

      case Kind::empty: {
        base::Duration cost = item.cost;
        script_.pop_front();
        return empty_poll(cost);
      }

      case Kind::failure:
        return item.error;

      case Kind::exception:
        script_.pop_front();
        throw std::runtime_error("FakeMessageIterator: scripted exception");
    }
    return base::Result::internal("unreachable");
  }

  base::Result advance() override {
    CHECK(!script_.empty() && script_.front().kind == Kind::record)
        << ": advance() without a successful peek()";
    script_.pop_front();
    ++advances_;
    return base::Result();
  }

 private:
  base::Result empty_poll(base::Duration cost) {
    if (clock_) clock_->add(cost);
    return base::Result::unavailable();
  }

  base::FakeMonotonicClock* clock_;
  std::deque<Item> script_;
  base::Duration idle_cost_;
  std::size_t peeks_;
  std::size_t advances_;
};

}  // namespace consumer

#endif  // CONSUMER_ITERATOR_FAKE_H

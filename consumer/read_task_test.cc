// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "base/clockfake.h"
#include "base/logging.h"
#include "base/result_testing.h"
#include "consumer/consumer_state.h"
#include "consumer/iterator_fake.h"
#include "consumer/read_task.h"

using consumer::ReadTask;
using consumer::Records;
using consumer::StepSignal;

namespace {
class ErrorCapture : public base::LogTarget {
 public:
  ErrorCapture() { base::log_target_add(this); }
  ~ErrorCapture() noexcept override { base::log_target_remove(this); }

  bool want(const char* file, unsigned int line,
            base::level_t level) const override {
    return level >= LOG_LEVEL_ERROR;
  }
  void log(const base::LogEntry& entry) override { ++count_; }
  void flush() override {}

  int count() const noexcept { return count_; }

 private:
  int count_ = 0;
};

class ReadTaskTest : public ::testing::Test {
 protected:
  ReadTaskTest() : iter_(nullptr) {
    opts_.set_request_timeout(base::milliseconds(100));
    opts_.set_iterator_backoff(base::milliseconds(10));
  }

  void make_state(consumer::RecordTranslator translator =
                      consumer::make_translator(consumer::RecordFormat::raw)) {
    pending_.reset(new consumer::FakeMessageIterator(&clock_));
    iter_ = pending_.get();
    auto factory = [this](const std::string& topic,
                          consumer::MessageIteratorPtr* out) -> base::Result {
      if (topic != "events" || !pending_) {
        return base::Result::not_found("no such topic \"", topic, "\"");
      }
      *out = std::move(pending_);
      return base::Result();
    };
    state_.reset(new consumer::ConsumerState(opts_, clock_,
                                             std::move(translator), factory));
  }

  std::unique_ptr<ReadTask> make_task(uint64_t max_bytes = 1000,
                                      const std::string& topic = "events") {
    auto sink = [this](const Records& records) {
      ++sink_calls_;
      sunk_ = records;
    };
    return std::unique_ptr<ReadTask>(
        new ReadTask(state_.get(), topic, max_bytes, sink));
  }

  consumer::TopicState* topic_state() {
    consumer::TopicState* ts = nullptr;
    CHECK_OK(state_->get_or_create_topic_state("events", &ts));
    return ts;
  }

  // Plays the part of the scheduler until |task| completes.
  // Every backoff is honored exactly; every immediate continuation after a
  // budget stop advances the clock by |idle|.
  int run_to_completion(ReadTask* task, base::Duration idle) {
    int steps = 0;
    while (true) {
      StepSignal signal = task->step();
      ++steps;
      EXPECT_LE(task->bytes_consumed(), task->max_response_bytes());
      if (signal.is_done()) break;
      if (signal.is_backoff()) {
        clock_.add(signal.until() - clock_.now());
      } else {
        clock_.add(idle);
      }
      if (steps > 10000) {
        ADD_FAILURE() << "task never completed";
        break;
      }
    }
    return steps;
  }

  consumer::ReadOptions opts_;
  base::FakeMonotonicClock clock_;
  std::unique_ptr<consumer::FakeMessageIterator> pending_;
  consumer::FakeMessageIterator* iter_;
  std::unique_ptr<consumer::ConsumerState> state_;
  int sink_calls_ = 0;
  Records sunk_;
};
}  // anonymous namespace

TEST_F(ReadTaskTest, StopsShortOfBudget) {
  make_state();
  iter_->push_sized(0, 0, 400);
  iter_->push_sized(0, 1, 400);
  iter_->push_sized(0, 2, 400);

  auto task = make_task(1000);
  EXPECT_EQ(StepSignal::continue_now(), task->step());
  EXPECT_FALSE(task->is_done());
  EXPECT_EQ(800U, task->bytes_consumed());
  EXPECT_EQ(2U, iter_->advances());
  EXPECT_EQ(1U, iter_->remaining());
  EXPECT_EQ(0, sink_calls_);

  // The third record still does not fit.
  EXPECT_EQ(StepSignal::continue_now(), task->step());
  EXPECT_EQ(800U, task->bytes_consumed());

  clock_.add(base::milliseconds(100));
  EXPECT_EQ(StepSignal::done(), task->step());
  ASSERT_TRUE(task->is_done());
  const Records& records = task->get();
  ASSERT_EQ(2U, records.size());
  EXPECT_EQ(0, records[0].offset);
  EXPECT_EQ(1, records[1].offset);
  EXPECT_EQ(1, sink_calls_);
  EXPECT_EQ(records, sunk_);

  // The deferred record is the first thing the next read sees.
  auto next = make_task(1000);
  EXPECT_EQ(StepSignal::backoff_until(clock_.now() + base::milliseconds(10)),
            next->step());
  EXPECT_EQ(400U, next->bytes_consumed());
  clock_.add(base::milliseconds(100));
  EXPECT_EQ(StepSignal::done(), next->step());
  ASSERT_EQ(1U, next->get().size());
  EXPECT_EQ(2, next->get()[0].offset);
}

TEST_F(ReadTaskTest, OversizedRecordIsNeverSplit) {
  make_state();
  iter_->push_sized(0, 0, 1500);

  auto task = make_task(1000);
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(StepSignal::continue_now(), task->step());
    EXPECT_EQ(0U, task->bytes_consumed());
    clock_.add(base::milliseconds(10));
  }
  clock_.add(base::milliseconds(50));
  EXPECT_EQ(StepSignal::done(), task->step());
  EXPECT_TRUE(task->get().empty());
  EXPECT_EQ(0U, iter_->advances());
  EXPECT_EQ(1U, iter_->remaining());
}

TEST_F(ReadTaskTest, EmptyTopicTimesOut) {
  make_state();
  iter_->set_idle_cost(base::milliseconds(1));

  auto task = make_task(1000);
  const base::MonotonicTime started = task->started();
  int steps = 0;
  while (true) {
    StepSignal signal = task->step();
    ++steps;
    if (signal.is_done()) break;
    EXPECT_LT(clock_.now() - started, base::milliseconds(100));
    ASSERT_TRUE(signal.is_backoff()) << signal;
    clock_.add(signal.until() - clock_.now());
  }
  EXPECT_EQ(11, steps);
  EXPECT_GE(clock_.now() - started, base::milliseconds(100));
  EXPECT_TRUE(task->get().empty());
  EXPECT_EQ(1, sink_calls_);
}

TEST_F(ReadTaskTest, UnknownTopic) {
  make_state();
  auto task = make_task(1000, "missing");
  EXPECT_TRUE(task->is_done());
  EXPECT_TRUE(task->get().empty());
  EXPECT_EQ(1, sink_calls_);
  EXPECT_EQ(StepSignal::done(), task->step());
  EXPECT_EQ(1, sink_calls_);
  EXPECT_EQ(0U, iter_->peeks());

  auto bad = make_task(1000, "no spaces allowed");
  EXPECT_TRUE(bad->is_done());
  EXPECT_TRUE(bad->get().empty());
  EXPECT_EQ(2, sink_calls_);
}

TEST_F(ReadTaskTest, DeadlineIsExact) {
  make_state();
  auto task = make_task(1000);
  const base::MonotonicTime started = task->started();

  clock_.add(base::milliseconds(99));
  StepSignal signal = task->step();
  ASSERT_TRUE(signal.is_backoff()) << signal;
  EXPECT_EQ(started + base::milliseconds(100), signal.until());
  EXPECT_FALSE(task->is_done());

  clock_.add(base::milliseconds(1));
  EXPECT_EQ(StepSignal::done(), task->step());
  EXPECT_TRUE(task->is_done());
}

TEST_F(ReadTaskTest, BackoffIsAnchoredAtIterationStart) {
  make_state();
  iter_->push_sized(0, 0, 10);
  iter_->push_empty(base::milliseconds(7));

  auto task = make_task(1000);
  const base::MonotonicTime first = clock_.now();
  StepSignal signal = task->step();
  EXPECT_EQ(StepSignal::backoff_until(first + base::milliseconds(10)), signal);
  EXPECT_EQ(first + base::milliseconds(10), task->wait_expiration());
  EXPECT_EQ(first + base::milliseconds(7), clock_.now());

  clock_.add(base::milliseconds(3));
  iter_->push_empty(base::milliseconds(2));
  const base::MonotonicTime second = clock_.now();
  signal = task->step();
  EXPECT_EQ(StepSignal::backoff_until(second + base::milliseconds(10)), signal);
  EXPECT_EQ(10U, task->bytes_consumed());

  clock_.add(base::milliseconds(100));
  EXPECT_EQ(StepSignal::done(), task->step());
  EXPECT_EQ(1U, task->get().size());
  EXPECT_FALSE(topic_state()->is_reading());
}

TEST_F(ReadTaskTest, BudgetNeverExceeded) {
  const std::vector<std::size_t> sizes = {300, 250, 600, 100, 50, 999,
                                          1,   0,   200, 800, 450, 1000};
  make_state();
  iter_->set_idle_cost(base::milliseconds(1));
  for (std::size_t i = 0; i < sizes.size(); ++i) {
    iter_->push_sized(0, static_cast<int64_t>(i), sizes[i]);
  }

  std::vector<int64_t> delivered;
  int tasks = 0;
  while (iter_->remaining() > 0 && tasks < 100) {
    ++tasks;
    auto task = make_task(1000);
    run_to_completion(task.get(), base::milliseconds(30));
    EXPECT_LE(task->bytes_consumed(), 1000U);
    uint64_t sum = 0;
    for (const auto& rec : task->get()) {
      delivered.push_back(rec.offset);
      sum += rec.value.size();
    }
    EXPECT_EQ(sum, task->bytes_consumed());
  }

  ASSERT_EQ(sizes.size(), delivered.size());
  for (std::size_t i = 0; i < delivered.size(); ++i) {
    EXPECT_EQ(static_cast<int64_t>(i), delivered[i]);
  }
}

TEST_F(ReadTaskTest, BudgetExhaustionCompletesImmediately) {
  make_state();
  iter_->push_sized(0, 0, 500);
  iter_->push_sized(0, 1, 500);
  iter_->push_sized(0, 2, 1);

  auto task = make_task(1000);
  EXPECT_EQ(StepSignal::done(), task->step());
  EXPECT_EQ(1000U, task->bytes_consumed());
  EXPECT_EQ(2U, task->get().size());
  EXPECT_EQ(1, sink_calls_);

  std::size_t peeks = iter_->peeks();
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(StepSignal::done(), task->step());
  }
  EXPECT_EQ(1, sink_calls_);
  EXPECT_EQ(peeks, iter_->peeks());

  int late = 0;
  task->on_finished([&late](const Records& records) {
    late += static_cast<int>(records.size());
  });
  EXPECT_EQ(2, late);
  EXPECT_EQ(1, sink_calls_);
}

TEST_F(ReadTaskTest, CeilingCapsRequestedBudget) {
  opts_.set_max_response_bytes(500);
  make_state();
  EXPECT_EQ(500U, make_task(1000)->max_response_bytes());
  EXPECT_EQ(200U, make_task(200)->max_response_bytes());
}

TEST_F(ReadTaskTest, HoldsTopicBetweenSteps) {
  make_state();
  auto task = make_task(1000);
  consumer::TopicState* ts = topic_state();
  EXPECT_FALSE(ts->is_reading());

  int other = 0;
  EXPECT_TRUE(task->step().is_backoff());
  EXPECT_TRUE(ts->is_read_by(task.get()));
  EXPECT_FALSE(ts->try_start_read(&other));

  // A step on another thread continues the same read.
  StepSignal signal;
  ReadTask* ptr = task.get();
  std::thread stepper([ptr, &signal] { signal = ptr->step(); });
  stepper.join();
  EXPECT_TRUE(signal.is_backoff()) << signal;
  EXPECT_TRUE(ts->is_read_by(task.get()));

  clock_.add(base::milliseconds(100));
  std::thread finisher([ptr, &signal] { signal = ptr->step(); });
  finisher.join();
  EXPECT_TRUE(signal.is_done()) << signal;
  EXPECT_FALSE(ts->is_reading());
  EXPECT_TRUE(ts->try_start_read(&other));
  ts->finish_read(&other);
}

TEST_F(ReadTaskTest, BusyTopicBacksOff) {
  make_state();
  iter_->push_sized(0, 0, 100);
  const base::MonotonicTime t0 = clock_.now();

  auto first = make_task(1000);
  EXPECT_TRUE(first->step().is_backoff());
  EXPECT_EQ(100U, first->bytes_consumed());

  // |first| holds the topic, so |second| waits without touching it.
  clock_.add(base::milliseconds(50));
  auto second = make_task(1000);
  auto third = make_task(1000);
  std::size_t peeks = iter_->peeks();
  EXPECT_EQ(StepSignal::backoff_until(t0 + base::milliseconds(60)),
            second->step());
  EXPECT_EQ(t0 + base::milliseconds(60), second->wait_expiration());
  EXPECT_EQ(peeks, iter_->peeks());
  EXPECT_EQ(0U, second->bytes_consumed());
  EXPECT_TRUE(topic_state()->is_read_by(first.get()));

  clock_.add(base::milliseconds(50));
  EXPECT_TRUE(first->step().is_done());
  ASSERT_EQ(1U, first->get().size());
  EXPECT_FALSE(topic_state()->is_reading());

  // Once released, the next step of |second| picks the topic up.
  iter_->push_sized(0, 1, 200);
  EXPECT_EQ(StepSignal::backoff_until(t0 + base::milliseconds(110)),
            second->step());
  EXPECT_EQ(200U, second->bytes_consumed());
  EXPECT_TRUE(topic_state()->is_read_by(second.get()));

  // |third| reaches its deadline while |second| still holds the topic.
  clock_.add(base::milliseconds(50));
  EXPECT_TRUE(topic_state()->is_read_by(second.get()));
  EXPECT_EQ(StepSignal::done(), third->step());
  EXPECT_TRUE(third->get().empty());
  EXPECT_TRUE(topic_state()->is_read_by(second.get()));

  EXPECT_EQ(StepSignal::done(), second->step());
  ASSERT_EQ(1U, second->get().size());
  EXPECT_EQ(1, second->get()[0].offset);
  EXPECT_FALSE(topic_state()->is_reading());
  EXPECT_EQ(3, sink_calls_);
}

TEST_F(ReadTaskTest, RecordsOffsets) {
  make_state();
  iter_->push_record(0, 5, "a", "1");
  iter_->push_record(1, 7, "b", "2");
  iter_->push_record(0, 6, "c", "3");

  auto task = make_task(1000);
  EXPECT_TRUE(task->step().is_backoff());

  consumer::OffsetMap expected = {{0, 6}, {1, 7}};
  EXPECT_EQ(expected, topic_state()->consumed_offsets());
  auto all = state_->consumed_offsets();
  ASSERT_EQ(1U, all.count("events"));
  EXPECT_EQ(expected, all["events"]);

  clock_.add(base::milliseconds(100));
  EXPECT_TRUE(task->step().is_done());
  Records records = task->get();
  ASSERT_EQ(3U, records.size());
  EXPECT_EQ(consumer::ClientRecord("a", "1", 0, 5), records[0]);
  EXPECT_EQ(consumer::ClientRecord("b", "2", 1, 7), records[1]);
  EXPECT_EQ(consumer::ClientRecord("c", "3", 0, 6), records[2]);
}

TEST_F(ReadTaskTest, IteratorFailureKeepsPartialRecords) {
  make_state();
  iter_->push_sized(0, 0, 100);
  iter_->push_failure(base::Result::unknown("broker went away"));

  ErrorCapture errors;
  auto task = make_task(1000);
  EXPECT_EQ(StepSignal::done(), task->step());
  EXPECT_EQ(1U, task->get().size());
  EXPECT_EQ(1, sink_calls_);
  EXPECT_FALSE(topic_state()->is_reading());
  EXPECT_EQ(1, errors.count());
}

TEST_F(ReadTaskTest, IteratorExceptionReleasesTopic) {
  make_state();
  iter_->push_sized(0, 0, 100);
  iter_->push_exception();
  iter_->push_sized(0, 1, 200);

  ErrorCapture errors;
  auto task = make_task(1000);
  EXPECT_EQ(StepSignal::done(), task->step());
  ASSERT_EQ(1U, task->get().size());
  EXPECT_EQ(0, task->get()[0].offset);
  EXPECT_FALSE(topic_state()->is_reading());
  EXPECT_LE(1, errors.count());

  // A fresh read picks up where the failed one left off.
  auto next = make_task(1000);
  EXPECT_TRUE(next->step().is_backoff());
  EXPECT_EQ(200U, next->bytes_consumed());
  clock_.add(base::milliseconds(100));
  EXPECT_TRUE(next->step().is_done());
  ASSERT_EQ(1U, next->get().size());
  EXPECT_EQ(1, next->get()[0].offset);
}

TEST_F(ReadTaskTest, TranslatorExceptionDefersRecord) {
  auto base_translator = consumer::make_translator(consumer::RecordFormat::raw);
  make_state([base_translator](const consumer::RawRecord& raw)
                 -> consumer::TranslatedRecord {
    if (raw.key == "poison") throw std::invalid_argument("cannot render");
    return base_translator(raw);
  });
  iter_->push_record(0, 0, "ok", "1");
  iter_->push_record(0, 1, "poison", "2");

  ErrorCapture errors;
  auto task = make_task(1000);
  EXPECT_EQ(StepSignal::done(), task->step());
  ASSERT_EQ(1U, task->get().size());
  EXPECT_EQ("ok", task->get()[0].key);
  EXPECT_EQ(1U, iter_->remaining());
  EXPECT_FALSE(topic_state()->is_reading());
}

TEST_F(ReadTaskTest, ThrowingSink) {
  make_state();
  iter_->push_sized(0, 0, 1000);

  ErrorCapture errors;
  auto sink = [](const Records&) { throw std::runtime_error("client gone"); };
  ReadTask task(state_.get(), "events", 1000, sink);
  EXPECT_EQ(StepSignal::done(), task.step());
  EXPECT_TRUE(task.is_done());
  EXPECT_EQ(1U, task.get().size());
  EXPECT_FALSE(topic_state()->is_reading());
  EXPECT_LE(1, errors.count());
}

TEST_F(ReadTaskTest, WaitTimeoutLeavesTaskRunning) {
  make_state();
  auto task = make_task(1000);
  EXPECT_FALSE(task->cancel());
  EXPECT_FALSE(task->is_cancelled());

  Records out;
  EXPECT_DEADLINE_EXCEEDED(task->get(base::milliseconds(5), &out));
  EXPECT_FALSE(task->is_done());
  EXPECT_TRUE(task->step().is_backoff());

  iter_->push_sized(0, 0, 1000);
  EXPECT_TRUE(task->step().is_done());
  EXPECT_OK(task->get(base::milliseconds(5), &out));
  EXPECT_EQ(1U, out.size());
  EXPECT_FALSE(task->is_cancelled());
}

TEST_F(ReadTaskTest, ManyWaiters) {
  make_state();
  iter_->push_sized(0, 0, 300);
  iter_->push_sized(1, 0, 300);
  auto task = make_task(1000);

  std::vector<Records> got(3);
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < got.size(); ++i) {
    ReadTask* ptr = task.get();
    threads.emplace_back([ptr, i, &got] { got[i] = ptr->get(); });
  }

  run_to_completion(task.get(), base::milliseconds(10));
  for (auto& t : threads) t.join();

  ASSERT_EQ(2U, task->get().size());
  for (const auto& records : got) EXPECT_EQ(task->get(), records);
  EXPECT_EQ(1, sink_calls_);
}

TEST(StepSignal, AsString) {
  EXPECT_EQ("continue_now", StepSignal::continue_now().as_string());
  EXPECT_EQ("done", StepSignal::done().as_string());
  EXPECT_EQ("backoff(MonotonicTime(250ms))",
            StepSignal::backoff_until(base::MonotonicTime::from_epoch(
                                          base::milliseconds(250)))
                .as_string());
  EXPECT_EQ(StepSignal::done(), StepSignal());
}

// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "consumer/read_worker.h"

#include "base/logging.h"
#include "base/mutex.h"

namespace consumer {

ReadWorker::ReadWorker(std::size_t num_threads, base::MonotonicClock clock)
    : clock_(std::move(clock)),
      running_(0),
      active_(0),
      completed_(0),
      stopping_(false) {
  CHECK_NE(num_threads, 0U);
  clock_.assert_valid();
  auto lock = base::acquire_lock(mu_);
  for (std::size_t i = 0; i < num_threads; ++i) {
    threads_.emplace_back([this] { loop(); });
    ++running_;
  }
  VLOG(1) << "consumer::ReadWorker: started " << num_threads << " threads";
}

ReadWorker::~ReadWorker() noexcept { shutdown(); }

std::shared_ptr<ReadTask> ReadWorker::read(ConsumerState* state,
                                           std::string topic,
                                           uint64_t max_bytes,
                                           ResultSink sink) {
  auto task = std::make_shared<ReadTask>(state, std::move(topic), max_bytes,
                                         std::move(sink));
  submit(task);
  return task;
}

void ReadWorker::submit(std::shared_ptr<ReadTask> task) {
  CHECK_NOTNULL(task.get());
  auto lock = base::acquire_lock(mu_);
  CHECK(!stopping_) << ": consumer::ReadWorker: submit() after shutdown()";
  if (task->is_done()) {
    ++completed_;
    return;
  }
  ready_.push_back(std::move(task));
  work_cv_.notify_one();
}

void ReadWorker::shutdown() {
  auto lock = base::acquire_lock(mu_);
  while (!idle()) idle_cv_.wait(lock);
  if (stopping_) return;
  stopping_ = true;
  auto threads = std::move(threads_);
  threads_.clear();
  work_cv_.notify_all();
  lock.unlock();

  for (auto& t : threads) t.join();
  VLOG(1) << "consumer::ReadWorker: stopped " << threads.size() << " threads";
}

ReadWorkerStats ReadWorker::stats() const {
  auto lock = base::acquire_lock(mu_);
  ReadWorkerStats tmp;
  tmp.num_workers = running_;
  tmp.pending_count = ready_.size();
  tmp.waiting_count = waiting_.size();
  tmp.active_count = active_;
  tmp.completed_count = completed_;
  return tmp;
}

bool ReadWorker::idle() const noexcept {
  return ready_.empty() && waiting_.empty() && active_ == 0;
}

void ReadWorker::loop() {
  auto lock = base::acquire_lock(mu_);
  while (true) {
    // Move every task whose backoff has expired to the ready queue.
    if (!waiting_.empty()) {
      const base::MonotonicTime now = clock_.now();
      auto it = waiting_.begin();
      while (it != waiting_.end() && it->first <= now) {
        ready_.push_back(std::move(it->second));
        it = waiting_.erase(it);
      }
    }

    if (!ready_.empty()) {
      TaskPtr task = std::move(ready_.front());
      ready_.pop_front();
      ++active_;
      lock.unlock();

      StepSignal signal = task->step();

      lock.lock();
      --active_;
      switch (signal.action()) {
        case StepAction::continue_now:
          ready_.push_back(std::move(task));
          break;

        case StepAction::backoff:
          waiting_.emplace(signal.until(), std::move(task));
          break;

        case StepAction::done:
          ++completed_;
          break;
      }
      // Sleeping threads must recompute their next wakeup.
      work_cv_.notify_all();
      if (idle()) idle_cv_.notify_all();
      continue;
    }

    if (stopping_) break;

    if (waiting_.empty()) {
      work_cv_.wait(lock);
    } else {
      base::Duration delay = waiting_.begin()->first - clock_.now();
      work_cv_.wait_for(lock, delay.to_chrono());
    }
  }
  --running_;
}

}  // namespace consumer

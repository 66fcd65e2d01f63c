// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "consumer/read_task.h"

#include <algorithm>
#include <exception>

#include "base/concat.h"
#include "base/logging.h"

namespace consumer {

static const char* const kStepActionNames[] = {
    "continue_now", "backoff", "done",
};

void append_to(std::string* out, StepAction action) {
  auto index = static_cast<uint8_t>(action);
  if (index < 3) {
    out->append(kStepActionNames[index]);
  } else {
    base::concat_to(out, "StepAction(", static_cast<unsigned int>(index), ")");
  }
}

void StepSignal::append_to(std::string* out) const {
  consumer::append_to(out, action_);
  if (action_ == StepAction::backoff) base::concat_to(out, "(", until_, ")");
}

std::string StepSignal::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

ReadTask::ReadTask(ConsumerState* parent, std::string topic,
                   uint64_t max_bytes, ResultSink sink)
    : parent_(CHECK_NOTNULL(parent)),
      topic_(std::move(topic)),
      max_bytes_(std::min(max_bytes, parent->options().max_response_bytes())),
      started_(parent->now()),
      topic_state_(nullptr),
      iter_(nullptr),
      reading_(false),
      bytes_consumed_(0),
      wait_expiration_(started_) {
  if (sink) promise_.on_finished(std::move(sink));

  base::Result r = parent_->get_or_create_topic_state(topic_, &topic_state_);
  if (!r) {
    LOG(INFO) << "consumer::ReadTask: cannot read topic \"" << topic_
              << "\": " << r;
    finish();
  }
}

ReadTask::~ReadTask() noexcept {
  if (reading_) {
    LOG(DFATAL) << "BUG! consumer::ReadTask: destroyed while reading "
                << "topic \"" << topic_ << "\"";
  }
}

StepSignal ReadTask::step() {
  if (is_done()) return StepSignal::done();

  StepSignal signal;
  base::Result r;
  try {
    r = drain(&signal);
  } catch (...) {
    LOG(ERROR) << "consumer::ReadTask: unexpected exception while reading "
               << "topic \"" << topic_ << "\"";
    LOG_EXCEPTION(std::current_exception());
    return abort();
  }
  if (!r) {
    LOG(ERROR) << "consumer::ReadTask: unexpected failure while reading "
               << "topic \"" << topic_ << "\": " << r;
    return abort();
  }
  VLOG(2) << "consumer::ReadTask: topic \"" << topic_ << "\": " << signal
          << " with " << bytes_consumed_ << "/" << max_bytes_ << " bytes";
  return signal;
}

base::Result ReadTask::drain(StepSignal* signal) {
  const ReadOptions& opts = parent_->options();
  const base::MonotonicTime iteration_start = parent_->now();
  bool backoff = false;

  if (!reading_) {
    if (parent_->try_start_read(topic_state_, this)) {
      reading_ = true;
      iter_ = topic_state_->iterator();
    } else {
      VLOG(2) << "consumer::ReadTask: topic \"" << topic_
              << "\" is busy with another read";
      backoff = true;
    }
  }

  RawRecord raw;
  while (reading_) {
    base::Result r = iter_->peek(&raw);
    if (r.code() == base::ResultCode::UNAVAILABLE) {
      backoff = true;
      break;
    }
    if (!r) return r;

    TranslatedRecord tr = parent_->translate(raw);
    if (bytes_consumed_ + tr.size > max_bytes_) break;

    r = iter_->advance();
    if (!r) return r;
    records_.push_back(std::move(tr.record));
    bytes_consumed_ += tr.size;
    topic_state_->set_consumed_offset(raw.partition, raw.offset);
  }

  const base::MonotonicTime now = parent_->now();
  const base::Duration elapsed = now - started_;
  const base::MonotonicTime backoff_expiration =
      iteration_start + opts.iterator_backoff();
  const base::MonotonicTime request_expiration =
      started_ + opts.request_timeout();
  wait_expiration_ = std::min(backoff_expiration, request_expiration);

  if (elapsed >= opts.request_timeout() || bytes_consumed_ >= max_bytes_) {
    release();
    finish();
    *signal = StepSignal::done();
  } else if (backoff) {
    *signal = StepSignal::backoff_until(wait_expiration_);
  } else {
    *signal = StepSignal::continue_now();
  }
  return base::Result();
}

StepSignal ReadTask::abort() {
  release();
  finish();
  return StepSignal::done();
}

void ReadTask::release() {
  if (!reading_) return;
  reading_ = false;
  iter_ = nullptr;
  parent_->finish_read(topic_state_, this);
}

void ReadTask::finish() {
  std::size_t n = records_.size();
  if (promise_.set(std::move(records_))) {
    VLOG(1) << "consumer::ReadTask: topic \"" << topic_ << "\" finished with "
            << n << " records, " << bytes_consumed_ << " bytes";
  }
  records_.clear();
}

}  // namespace consumer

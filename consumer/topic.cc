// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "consumer/topic.h"

#include "base/logging.h"
#include "base/mutex.h"

namespace consumer {

TopicState::TopicState(std::string name, MessageIteratorPtr iter)
    : name_(std::move(name)), iter_(std::move(iter)), owner_(nullptr) {
  CHECK_NOTNULL(iter_.get());
}

TopicState::~TopicState() noexcept {
  auto lock = base::acquire_lock(mu_);
  if (owner_ != nullptr) {
    LOG(DFATAL) << "BUG! consumer::TopicState: destroyed while "
                << "topic \"" << name_ << "\" is being read";
  }
}

void TopicState::start_read(const void* owner) {
  CHECK_NOTNULL(owner);
  auto lock = base::acquire_lock(mu_);
  CHECK(owner_ != owner) << ": topic \"" << name_
                         << "\" is already read by this reader";
  while (owner_ != nullptr) cv_.wait(lock);
  owner_ = owner;
}

bool TopicState::try_start_read(const void* owner) {
  CHECK_NOTNULL(owner);
  auto lock = base::acquire_lock(mu_);
  if (owner_ != nullptr) return false;
  owner_ = owner;
  return true;
}

void TopicState::finish_read(const void* owner) {
  auto lock = base::acquire_lock(mu_);
  DCHECK(owner_ != nullptr) << ": topic \"" << name_
                            << "\" is not being read";
  DCHECK(owner_ == owner) << ": topic \"" << name_
                          << "\" is read by another reader";
  owner_ = nullptr;
  lock.unlock();
  cv_.notify_one();
}

bool TopicState::is_reading() const noexcept {
  auto lock = base::acquire_lock(mu_);
  return owner_ != nullptr;
}

bool TopicState::is_read_by(const void* owner) const noexcept {
  auto lock = base::acquire_lock(mu_);
  return owner_ != nullptr && owner_ == owner;
}

MessageIterator* TopicState::iterator() const noexcept {
  return iter_.get();
}

void TopicState::set_consumed_offset(int32_t partition, int64_t offset) {
  auto lock = base::acquire_lock(mu_);
  offsets_[partition] = offset;
}

OffsetMap TopicState::consumed_offsets() const {
  auto lock = base::acquire_lock(mu_);
  return offsets_;
}

}  // namespace consumer

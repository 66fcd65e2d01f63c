// event/promise.h - Single-assignment values with blocking retrieval
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef EVENT_PROMISE_H
#define EVENT_PROMISE_H

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "base/duration.h"
#include "base/logging.h"
#include "base/mutex.h"
#include "base/result.h"

namespace event {

namespace internal {

template <typename T>
struct PromiseState {
  using Callback = std::function<void(const T&)>;

  mutable std::mutex mu;
  mutable std::condition_variable cv;
  bool claimed;
  bool done;
  T value;
  std::vector<Callback> on_finished;

  PromiseState() : claimed(false), done(false), value() {}
};

template <typename T>
void lifo_callbacks(std::vector<std::function<void(const T&)>> vec,
                    const T& value) noexcept {
  while (!vec.empty()) {
    auto cb = std::move(vec.back());
    vec.pop_back();
    try {
      cb(value);
    } catch (...) {
      LOG_EXCEPTION(std::current_exception());
    }
  }
}

template <typename T>
void add_callback(PromiseState<T>& state,
                  typename PromiseState<T>::Callback cb) {
  auto lock = base::acquire_lock(state.mu);
  if (!state.done) {
    state.on_finished.push_back(std::move(cb));
    return;
  }
  lock.unlock();
  std::vector<typename PromiseState<T>::Callback> vec;
  vec.push_back(std::move(cb));
  lifo_callbacks(std::move(vec), state.value);
}

}  // namespace internal

template <typename T>
class Future;  // forward declaration

// A Promise is the producer side of a single-assignment value.
//
// The first call to |set()| stores the value, runs the registered
// |on_finished| callbacks (most recently registered first) on the calling
// thread, and then marks the Promise done and wakes every waiter. Every later
// call to |set()| is ignored.
//
// Compare and contrast with |std::promise|: a second |std::promise::set_value|
// throws, while a second |Promise::set| quietly returns false.
//
// THREAD SAFETY: This class is thread-safe.
//
template <typename T>
class Promise {
 public:
  using Callback = typename internal::PromiseState<T>::Callback;

  Promise() : state_(std::make_shared<internal::PromiseState<T>>()) {}

  // Promises are copyable and moveable; copies share the same value.
  Promise(const Promise&) = default;
  Promise(Promise&&) noexcept = default;
  Promise& operator=(const Promise&) = default;
  Promise& operator=(Promise&&) noexcept = default;

  // Publishes |value|.
  // - Returns true if this call completed the Promise
  // - Returns false, without side effects, if it was already complete
  bool set(T value) const;

  // Returns true iff |set()| has been called.
  bool is_done() const noexcept {
    auto lock = base::acquire_lock(state_->mu);
    return state_->done;
  }

  // Registers a Callback to run when the Promise completes.
  // - Will execute |cb| immediately if the Promise is already complete
  void on_finished(Callback cb) const;

  // Returns a Future that observes this Promise.
  Future<T> future() const { return Future<T>(state_); }

 private:
  std::shared_ptr<internal::PromiseState<T>> state_;
};

// A Future is the consumer side of a Promise.
//
// THREAD SAFETY: This class is thread-safe.
//
template <typename T>
class Future {
 public:
  Future() noexcept = default;
  explicit Future(std::shared_ptr<internal::PromiseState<T>> state) noexcept
      : state_(std::move(state)) {}

  // A valid Future is one that was obtained from a Promise.
  explicit operator bool() const noexcept { return !!state_; }

  // Returns true iff the value is available.
  bool is_done() const noexcept {
    auto lock = base::acquire_lock(state_->mu);
    return state_->done;
  }

  // Blocks until the value is available, then returns it.
  // The reference remains valid for as long as any Future or Promise does.
  const T& wait() const {
    auto lock = base::acquire_lock(state_->mu);
    while (!state_->done) state_->cv.wait(lock);
    return state_->value;
  }

  // Blocks for at most |timeout| until the value is available.
  // - Returns OK and copies the value into |out| on success
  // - Returns DEADLINE_EXCEEDED if the value did not arrive in time
  base::Result wait_for(base::Duration timeout, T* out) const {
    auto lock = base::acquire_lock(state_->mu);
    bool ok = state_->cv.wait_for(lock, timeout.to_chrono(),
                                  [this] { return state_->done; });
    if (!ok) {
      return base::Result::deadline_exceeded("timed out after ", timeout);
    }
    if (out) *out = state_->value;
    return base::Result();
  }

  void on_finished(typename Promise<T>::Callback cb) const;

 private:
  std::shared_ptr<internal::PromiseState<T>> state_;
};

template <typename T>
bool Promise<T>::set(T value) const {
  auto lock = base::acquire_lock(state_->mu);
  if (state_->claimed) return false;
  state_->claimed = true;
  state_->value = std::move(value);
  auto callbacks = std::move(state_->on_finished);
  state_->on_finished.clear();
  lock.unlock();

  // |value| is immutable from here on, so it may be read without the lock.
  internal::lifo_callbacks(std::move(callbacks), state_->value);

  lock.lock();
  state_->done = true;
  auto late = std::move(state_->on_finished);
  state_->on_finished.clear();
  lock.unlock();
  state_->cv.notify_all();
  internal::lifo_callbacks(std::move(late), state_->value);
  return true;
}

template <typename T>
void Promise<T>::on_finished(Callback cb) const {
  internal::add_callback(*state_, std::move(cb));
}

template <typename T>
void Future<T>::on_finished(typename Promise<T>::Callback cb) const {
  internal::add_callback(*state_, std::move(cb));
}

}  // namespace event

#endif  // EVENT_PROMISE_H

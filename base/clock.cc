// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/clock.h"

#include <time.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <system_error>

#include "base/mutex.h"

namespace base {

void MonotonicClock::assert_valid() const {
  if (!ptr_) throw std::logic_error("base::MonotonicClock is empty");
}

class SystemMonotonicClock : public MonotonicClockImpl {
 public:
  SystemMonotonicClock() noexcept = default;

  MonotonicTime now() const override {
    struct timespec ts;
    ::bzero(&ts, sizeof(ts));
    int rc = ::clock_gettime(CLOCK_MONOTONIC, &ts);
    if (rc != 0) {
      int err_no = errno;
      throw std::system_error(err_no, std::system_category(),
                              "clock_gettime(2)");
    }
    return MonotonicTime::from_epoch(seconds(ts.tv_sec) +
                                     nanoseconds(ts.tv_nsec));
  }
};

static std::mutex g_sysclk_mu;
static MonotonicClock* g_sysclk_mono = nullptr;  // protected by g_sysclk_mu

static void initialize_clock() {
  if (g_sysclk_mono == nullptr) g_sysclk_mono = new MonotonicClock;
  if (!*g_sysclk_mono) {
    *g_sysclk_mono = MonotonicClock(std::make_shared<SystemMonotonicClock>());
  }
}

MonotonicClock system_monotonic_clock() {
  auto lock = acquire_lock(g_sysclk_mu);
  initialize_clock();
  return *g_sysclk_mono;
}

void set_system_monotonic_clock(MonotonicClock clock) {
  auto lock = acquire_lock(g_sysclk_mu);
  initialize_clock();
  *g_sysclk_mono = std::move(clock);
}

}  // namespace base

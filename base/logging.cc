// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/logging.h"

#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <array>
#include <cstdio>
#include <mutex>
#include <system_error>
#include <typeinfo>
#include <vector>

#include "base/concat.h"
#include "base/mutex.h"
#include "base/result.h"

namespace base {

static pid_t my_gettid() { return syscall(SYS_gettid); }

static int my_gettimeofday(struct timeval* tv, struct timezone* unused) {
  return ::gettimeofday(tv, nullptr);
}

inline namespace implementation {

using Vec = std::vector<LogTarget*>;

static std::mutex g_mu;
static level_t g_stderr = LOG_LEVEL_INFO;  // protected by g_mu
static GetTidFunc g_gtid = my_gettid;      // protected by g_mu
static GetTimeOfDayFunc g_gtod = my_gettimeofday;  // protected by g_mu
static Vec* g_vec = nullptr;               // protected by g_mu

class LogSTDERR : public LogTarget {
 public:
  LogSTDERR() noexcept = default;
  bool want(const char* file, unsigned int line, level_t level) const override {
    // g_mu held by caller
    return level >= g_stderr;
  }
  void log(const LogEntry& entry) override {
    auto str = entry.as_string();
    ssize_t n = ::write(2, str.data(), str.size());
    (void)n;
  }
  void flush() override { ::fdatasync(2); }
};

static Vec& targets() {
  // g_mu held by caller
  if (g_vec == nullptr) g_vec = new Vec{new LogSTDERR};
  return *g_vec;
}

template <typename F>
static void ignore_exceptions(F func) {
  try {
    func();
  } catch (...) {
    // a broken LogTarget must not take down the caller
  }
}

static void maybe_terminate(const LogEntry& entry) {
  if (entry.level >= LOG_LEVEL_FATAL) std::terminate();
#ifndef NDEBUG
  if (entry.level >= LOG_LEVEL_DFATAL) std::terminate();
#endif
}

}  // inline namespace implementation

LogEntry::LogEntry(const char* file, unsigned int line, level_t level,
                   std::string message)
    : file(file), line(line), level(level), message(std::move(message)) {
  auto lock = acquire_lock(g_mu);
  ::bzero(&time, sizeof(time));
  (*g_gtod)(&time, nullptr);
  tid = (*g_gtid)();
}

void LogEntry::append_to(std::string* out) const {
  char ch;
  if (level >= LOG_LEVEL_DFATAL) {
    ch = 'F';
  } else if (level >= LOG_LEVEL_ERROR) {
    ch = 'E';
  } else if (level >= LOG_LEVEL_WARN) {
    ch = 'W';
  } else if (level >= LOG_LEVEL_INFO) {
    ch = 'I';
  } else {
    ch = 'D';
  }

  struct tm tm;
  ::gmtime_r(&time.tv_sec, &tm);

  // "[IWEFD]<mm><dd> <hh>:<mm>:<ss>.<uuuuuu>  <tid> <file>:<line>] <message>"

  std::array<char, 24> buf;
  ::snprintf(buf.data(), buf.size(), "%c%02u%02u %02u:%02u:%02u.%06lu  ", ch,
             tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
             static_cast<unsigned long>(time.tv_usec));

  concat_to(out, buf.data(), tid, ' ', file, ':', line, "] ", message, '\n');
}

std::string LogEntry::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

Logger::Logger(const char* file, unsigned int line, level_t level)
    : file_(file), line_(line), level_(level) {
  if (file == nullptr || line == 0) std::terminate();
  if (want(file, line, level)) ss_.reset(new std::ostringstream);
}

bool want(const char* file, unsigned int line, level_t level) {
  if (level >= LOG_LEVEL_DFATAL) return true;
  auto lock = acquire_lock(g_mu);
  bool result = false;
  for (const LogTarget* target : targets()) {
    ignore_exceptions([file, line, level, target, &result] {
      result = target->want(file, line, level);
    });
    if (result) break;
  }
  return result;
}

void log(const LogEntry& entry) {
  if (entry) {
    auto lock = acquire_lock(g_mu);
    for (LogTarget* target : targets()) {
      ignore_exceptions([&entry, target] {
        if (target->want(entry.file, entry.line, entry.level)) {
          target->log(entry);
        }
      });
    }
    if (entry.level >= LOG_LEVEL_ERROR) {
      for (LogTarget* target : targets()) {
        ignore_exceptions([target] { target->flush(); });
      }
    }
  }
  maybe_terminate(entry);
}

void log_flush() {
  auto lock = acquire_lock(g_mu);
  for (LogTarget* target : targets()) {
    ignore_exceptions([target] { target->flush(); });
  }
}

void log_stderr_set_level(level_t level) {
  auto lock = acquire_lock(g_mu);
  g_stderr = level;
}

void log_target_add(LogTarget* target) {
  auto lock = acquire_lock(g_mu);
  targets().push_back(target);
}

void log_target_remove(LogTarget* target) {
  auto lock = acquire_lock(g_mu);
  auto& v = targets();
  for (auto it = v.begin(), end = v.end(); it != end; ++it) {
    if (*it == target) {
      v.erase(it);
      break;
    }
  }
}

void log_set_gettid(GetTidFunc func) {
  auto lock = acquire_lock(g_mu);
  g_gtid = func ? func : my_gettid;
}

void log_set_gettimeofday(GetTimeOfDayFunc func) {
  auto lock = acquire_lock(g_mu);
  g_gtod = func ? func : my_gettimeofday;
}

namespace internal {

void log_exception(const char* file, unsigned int line, std::exception_ptr e) {
  Logger logger(file, line, LOG_LEVEL_ERROR);
  try {
    std::rethrow_exception(e);
  } catch (const std::system_error& e) {
    const auto& ecode = e.code();
    logger << "caught std::system_error\n"
           << "\t" << ecode.category().name() << "(" << ecode.value()
           << "): " << e.what();
  } catch (const std::exception& e) {
    logger << "caught std::exception\n"
           << "\t[" << typeid(e).name() << "]\n"
           << "\t" << e.what();
  } catch (...) {
    logger << "caught unclassifiable exception!";
  }
}

Logger log_check(const char* file, unsigned int line, const char* expr,
                 bool cond) {
  if (cond) return Logger();
  Logger logger(file, line, LOG_LEVEL_DFATAL);
  logger << "CHECK FAILED: " << expr;
  return logger;
}

Logger log_check_ok(const char* file, unsigned int line, const char* expr,
                    const Result& rslt) {
  if (rslt) return Logger();
  Logger logger(file, line, LOG_LEVEL_DFATAL);
  logger << "CHECK FAILED: " << expr << ": " << rslt.as_string();
  return logger;
}

}  // namespace internal

}  // namespace base

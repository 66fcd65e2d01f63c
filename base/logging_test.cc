// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <stdexcept>
#include <string>

#include "base/logging.h"
#include "base/result.h"
#include "re2/re2.h"

static pid_t my_gettid() { return 42; }

static int my_gettimeofday(struct timeval* tv, struct timezone* unused) {
  // Mon 2006 Jan 02 15:04:05.123456 -0700
  tv->tv_sec = 1136239445;
  tv->tv_usec = 123456;
  return 0;
}

namespace {
class LogCapture : public base::LogTarget {
 public:
  explicit LogCapture(base::level_t min) noexcept : min_(min) {}

  bool want(const char* file, unsigned int line,
            base::level_t level) const override {
    return level >= min_;
  }

  void log(const base::LogEntry& entry) override { entry.append_to(&out_); }

  void flush() override {}

  // Returns the captured text with directories and line numbers normalized.
  std::string normalized() const {
    std::string str = out_;
    re2::RE2::GlobalReplace(&str, "[^ ]*/(logging_test\\.cc):[0-9]+\\] ",
                            "\\1:XX] ");
    return str;
  }

 private:
  base::level_t min_;
  std::string out_;
};
}  // anonymous namespace

static void setup(LogCapture* target) {
  base::log_set_gettid(my_gettid);
  base::log_set_gettimeofday(my_gettimeofday);
  base::log_target_add(target);
}

static void teardown(LogCapture* target) {
  base::log_target_remove(target);
  base::log_set_gettid(nullptr);
  base::log_set_gettimeofday(nullptr);
}

TEST(Logger, EndToEnd) {
  LogCapture target(LOG_LEVEL_INFO);
  setup(&target);

  VLOG(1) << "who cares?";
  LOG(INFO) << "hello";
  LOG(WARN) << "uh oh";
  LOG(ERROR) << "oh no!";

  teardown(&target);

  std::string expected(
      "I0102 22:04:05.123456  42 logging_test.cc:XX] hello\n"
      "W0102 22:04:05.123456  42 logging_test.cc:XX] uh oh\n"
      "E0102 22:04:05.123456  42 logging_test.cc:XX] oh no!\n");
  EXPECT_EQ(expected, target.normalized());
}

TEST(Logger, Verbose) {
  LogCapture target(VLOG_LEVEL(2));
  setup(&target);

  VLOG(1) << "step";
  VLOG(2) << "backoff";
  VLOG(3) << "too chatty";

  teardown(&target);

  std::string expected(
      "D0102 22:04:05.123456  42 logging_test.cc:XX] step\n"
      "D0102 22:04:05.123456  42 logging_test.cc:XX] backoff\n");
  EXPECT_EQ(expected, target.normalized());
}

TEST(Logger, Exception) {
  LogCapture target(LOG_LEVEL_ERROR);
  setup(&target);

  try {
    throw std::runtime_error("iterator exploded");
  } catch (...) {
    LOG_EXCEPTION(std::current_exception());
  }

  teardown(&target);

  std::string text = target.normalized();
  EXPECT_TRUE(RE2::PartialMatch(text, "^E0102 .* logging_test.cc:XX] "
                                      "caught std::exception\n"))
      << text;
  EXPECT_NE(std::string::npos, text.find("\titerator exploded\n")) << text;
}

TEST(Check, Correct) {
  CHECK(true) << ": not used";
  CHECK_NE(0, 1) << ": not used";
  CHECK_LT(2, 3) << ": not used";
  CHECK_LE(3, 3) << ": not used";
  CHECK_EQ(3, 3) << ": not used";
  CHECK_OK(base::Result()) << ": not used";
}

TEST(CheckDeathTest, Wrong) {
  const int p = 1, r = 3;
  EXPECT_DEATH(LOG(FATAL) << "aaaah!", "aaaah!");
  EXPECT_DEATH(CHECK_EQ(p, r) << ": error #5",
               "CHECK FAILED: p == r \\[1 == 3\\]: error #5");
  EXPECT_DEATH(CHECK_OK(base::Result::not_found("no topic")),
               "CHECK FAILED: .*NOT_FOUND\\(5\\): no topic");
}

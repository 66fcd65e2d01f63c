// base/result.h - Value type representing operation success or failure
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_RESULT_H
#define BASE_RESULT_H

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include "base/concat.h"

namespace base {

// ResultCode denotes the type of success/failure that a Result represents.
enum class ResultCode : uint8_t {
  // Success.
  OK = 0x00,

  // Failure of an unknown type, or whose type does not fit into these codes.
  UNKNOWN = 0x01,

  // Internal-only failure that should never be seen by the user.
  INTERNAL = 0x02,

  // The operation was cancelled before it could complete.
  CANCELLED = 0x03,

  // The world was in a state that was not compatible with the operation.
  // For example: resolving a topic after its consumer was closed.
  FAILED_PRECONDITION = 0x04,

  // The operation was unable to find the specified resource.
  // For example: reading from a topic that does not exist.
  // Subtype of: FAILED_PRECONDITION
  NOT_FOUND = 0x05,

  // The operation failed because of an argument that doesn't make sense.
  // For example: a topic name containing illegal characters.
  INVALID_ARGUMENT = 0x0a,

  // The operation failed because an argument was outside the valid range.
  // For example: appending to a partition that the topic does not have.
  // Subtype of: INVALID_ARGUMENT
  OUT_OF_RANGE = 0x0b,

  // The operation failed because the resource was not available.
  // For example: a message iterator with no data within its poll window.
  UNAVAILABLE = 0x0d,

  // The operation took so long that we gave up on it.
  // For example: waiting on a read that has not completed yet.
  DEADLINE_EXCEEDED = 0x10,
};

// Returns the string representation of a Code.
const std::string& resultcode_name(ResultCode code) noexcept;

inline std::ostream& operator<<(std::ostream& os, ResultCode arg) {
  return (os << resultcode_name(arg));
}

namespace internal {
struct ResultRep {
  ResultCode code;
  std::string message;

  ResultRep(ResultCode code, std::string message) noexcept
      : code(code),
        message(std::move(message)) {}
};

const std::string& empty_string() noexcept;
}  // namespace internal

// Result represents the success or failure of an operation.
// Failures are further categorized by the type of failure.
class Result {
 public:
  using Code = ResultCode;

  static const std::string& code_name(Code code) noexcept {
    return resultcode_name(code);
  }

 private:
  using Rep = internal::ResultRep;
  using RepPtr = std::shared_ptr<const Rep>;

  static RepPtr make(Code code, std::string message);

 public:
  // Constructors for fixed Code values {{{

  template <typename... Args>
  static Result unknown(const Args&... args) {
    return Result(Code::UNKNOWN, concat(args...));
  }

  template <typename... Args>
  static Result internal(const Args&... args) {
    return Result(Code::INTERNAL, concat(args...));
  }

  template <typename... Args>
  static Result cancelled(const Args&... args) {
    return Result(Code::CANCELLED, concat(args...));
  }

  template <typename... Args>
  static Result failed_precondition(const Args&... args) {
    return Result(Code::FAILED_PRECONDITION, concat(args...));
  }

  template <typename... Args>
  static Result not_found(const Args&... args) {
    return Result(Code::NOT_FOUND, concat(args...));
  }

  template <typename... Args>
  static Result invalid_argument(const Args&... args) {
    return Result(Code::INVALID_ARGUMENT, concat(args...));
  }

  template <typename... Args>
  static Result out_of_range(const Args&... args) {
    return Result(Code::OUT_OF_RANGE, concat(args...));
  }

  template <typename... Args>
  static Result unavailable(const Args&... args) {
    return Result(Code::UNAVAILABLE, concat(args...));
  }

  template <typename... Args>
  static Result deadline_exceeded(const Args&... args) {
    return Result(Code::DEADLINE_EXCEEDED, concat(args...));
  }

  // }}}

  // Result is default constructible, copyable, and moveable.
  // The default-constructed value has code OK and message "".
  Result() noexcept = default;
  Result(const Result&) noexcept = default;
  Result(Result&&) noexcept = default;
  Result& operator=(const Result&) noexcept = default;
  Result& operator=(Result&&) noexcept = default;

  Result(Code code, std::string message = std::string())
      : rep_(make(code, std::move(message))) {}

  void swap(Result& other) noexcept { rep_.swap(other.rep_); }

  // Checks if the Result was successful.
  explicit operator bool() const noexcept { return !rep_; }

  // Returns the Code for this Result.
  Code code() const noexcept {
    if (rep_) return rep_->code;
    return Code::OK;
  }

  // Returns the message associated with this Result.
  const std::string& message() const noexcept {
    if (rep_) return rep_->message;
    return internal::empty_string();
  }

  // Helper for chaining together blocks of code, conditional on success.
  // Short-circuits to the first failure.
  //
  // Typical usage:
  //
  //    base::Result result = options.validate().and_then([&] {
  //      return state->get_or_create_topic_state(topic, &ts);
  //    });
  //
  template <typename F, typename... Args>
  Result and_then(F continuation, Args&&... args) const {
    if (rep_) return *this;
    return continuation(std::forward<Args>(args)...);
  }

  // Stringifies this Result into a human-friendly form.
  std::string as_string() const;
  void append_to(std::string* out) const;

 private:
  RepPtr rep_;
};

inline void swap(Result& a, Result& b) noexcept { a.swap(b); }

inline std::ostream& operator<<(std::ostream& os, const Result& arg) {
  return (os << arg.as_string());
}

}  // namespace base

#endif  // BASE_RESULT_H

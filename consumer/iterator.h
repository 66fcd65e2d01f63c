// consumer/iterator.h - Interface for pulling records from one topic
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CONSUMER_ITERATOR_H
#define CONSUMER_ITERATOR_H

#include <functional>
#include <memory>
#include <string>

#include "base/result.h"
#include "consumer/record.h"

namespace consumer {

// A MessageIterator is a blocking, pull-based cursor over one topic.
//
// THREAD SAFETY: This class is NOT thread-safe. A TopicState serializes
//                access to its MessageIterator.
//
class MessageIterator {
 protected:
  MessageIterator() noexcept = default;

 public:
  virtual ~MessageIterator() noexcept = default;

  // MessageIterators are neither copyable nor moveable.
  MessageIterator(const MessageIterator&) = delete;
  MessageIterator(MessageIterator&&) = delete;
  MessageIterator& operator=(const MessageIterator&) = delete;
  MessageIterator& operator=(MessageIterator&&) = delete;

  // Copies the next record into |out| without consuming it.
  // - Returns OK if a record is available
  // - Returns UNAVAILABLE if no record arrived within the poll window
  // - Returns any other code if the iterator is broken
  //
  // Repeated calls without an intervening |advance()| yield the same record.
  //
  virtual base::Result peek(RawRecord* out) = 0;

  // Consumes the record most recently returned by |peek()|.
  // PRECONDITION: the most recent |peek()| returned OK
  virtual base::Result advance() = 0;
};

using MessageIteratorPtr = std::unique_ptr<MessageIterator>;

// An IteratorFactory opens a MessageIterator for the named topic.
// - Returns NOT_FOUND if the topic does not exist
using IteratorFactory =
    std::function<base::Result(const std::string& topic,
                               MessageIteratorPtr* out)>;

}  // namespace consumer

#endif  // CONSUMER_ITERATOR_H

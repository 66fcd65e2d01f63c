// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "base/clock.h"
#include "base/logging.h"
#include "consumer/consumer_state.h"
#include "consumer/memory_log.h"
#include "consumer/read_worker.h"

// Usage: readdemo [num_reads [max_bytes]]
int main(int argc, char** argv) {
  int num_reads = 5;
  uint64_t max_bytes = 256;
  if (argc > 1) num_reads = std::atoi(argv[1]);
  if (argc > 2) max_bytes = std::strtoull(argv[2], nullptr, 10);
  if (num_reads <= 0 || max_bytes == 0) {
    std::cerr << "usage: " << argv[0] << " [num_reads [max_bytes]]\n";
    return 2;
  }

  consumer::ReadOptions opts;
  opts.set_request_timeout(base::milliseconds(200));
  opts.set_iterator_backoff(base::milliseconds(20));
  opts.set_worker_threads(2);

  consumer::MemoryLog log(opts.iterator_timeout());
  CHECK_OK(log.create_topic("demo", 3));

  consumer::ConsumerState state(
      opts, base::system_monotonic_clock(),
      consumer::make_translator(consumer::RecordFormat::binary),
      log.iterator_factory());

  std::atomic<bool> stop(false);
  std::thread producer([&log, &stop] {
    int64_t n = 0;
    while (!stop.load()) {
      int32_t partition = static_cast<int32_t>(n % 3);
      CHECK_OK(log.append("demo", partition, "key-" + std::to_string(n),
                          "hello #" + std::to_string(n)));
      ++n;
      std::this_thread::sleep_for(std::chrono::milliseconds(15));
    }
  });

  consumer::ReadWorker worker(opts.worker_threads(), state.clock());
  for (int i = 0; i < num_reads; ++i) {
    auto task = worker.read(&state, "demo", max_bytes, nullptr);
    const consumer::Records& records = task->get();
    std::cout << "read #" << i << ": " << records.size() << " records, "
              << task->bytes_consumed() << "/" << task->max_response_bytes()
              << " bytes\n";
    for (const auto& rec : records) {
      std::cout << "  " << rec << "\n";
    }
  }

  stop = true;
  producer.join();
  worker.shutdown();

  for (const auto& topic : state.consumed_offsets()) {
    for (const auto& pair : topic.second) {
      std::cout << "committed " << topic.first << "/" << pair.first << " @ "
                << pair.second << "\n";
    }
  }
  std::cout << std::flush;
  return 0;
}

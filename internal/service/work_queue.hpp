#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace sportsledger::service {

/*
  Thread-safe blocking queue of batch unit indices.

  After Close() the queue drains and then Dequeue() returns nullopt.
*/
class WorkQueue {
 public:
  void Enqueue(std::size_t unit);

  // blocking wait
  std::optional<std::size_t> Dequeue();

  void Close();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<std::size_t> queue_;
  bool                    closed_ = false;
};

} // namespace sportsledger::service

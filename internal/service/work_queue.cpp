#include "work_queue.hpp"

namespace sportsledger::service {

void WorkQueue::Enqueue(std::size_t unit) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(unit);
  }
  cv_.notify_one();
}

std::optional<std::size_t> WorkQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  std::size_t unit = queue_.front();
  queue_.pop();
  return unit;
}

void WorkQueue::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

} // namespace sportsledger::service

#include "unsolicited_queue.h"

#include <utility>

namespace loco::client {

bool UnsolicitedQueue::Push(Packet packet) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    packets_.push_back(std::move(packet));
  }
  cv_.notify_one();
  return true;
}

bool UnsolicitedQueue::Next(Packet& out, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout,
               [this] { return closed_ || !packets_.empty(); });
  if (packets_.empty()) {
    return false;
  }
  out = std::move(packets_.front());
  packets_.pop_front();
  return true;
}

bool UnsolicitedQueue::TryNext(Packet& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (packets_.empty()) {
    return false;
  }
  out = std::move(packets_.front());
  packets_.pop_front();
  return true;
}

void UnsolicitedQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool UnsolicitedQueue::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t UnsolicitedQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return packets_.size();
}

}  // namespace loco::client

#ifndef LOCO_CLIENT_UNSOLICITED_QUEUE_H
#define LOCO_CLIENT_UNSOLICITED_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "packet.h"

namespace loco::client {

// Unbounded FIFO of server-pushed packets. Closing is permanent; packets
// queued before Close can still be drained.
class UnsolicitedQueue {
 public:
  UnsolicitedQueue() = default;

  UnsolicitedQueue(const UnsolicitedQueue&) = delete;
  UnsolicitedQueue& operator=(const UnsolicitedQueue&) = delete;

  // Dropped once closed.
  bool Push(Packet packet);
  // Returns false on timeout, or when closed and empty.
  bool Next(Packet& out, std::chrono::milliseconds timeout);
  bool TryNext(Packet& out);
  void Close();

  bool closed() const;
  std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Packet> packets_;
  bool closed_{false};
};

}  // namespace loco::client

#endif  // LOCO_CLIENT_UNSOLICITED_QUEUE_H

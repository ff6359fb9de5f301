// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace peerlink {
namespace network {

enum class MessagePriority {
  Urgent, // written synchronously by the scheduler loop, in submission order
  Normal  // dispatched as independent sends; no relative ordering
};

const char *ToString(MessagePriority priority);

/**
 * WriteScheduler - outbound queues and the single writer loop of a peer
 *
 * Producers call try_enqueue() from any thread; it never blocks. One
 * thread calls run(), which:
 *   - sends urgent messages synchronously (send callback)
 *   - before handing a normal message to the dispatch callback, sends
 *     every urgent message queued at that instant
 *
 * So an urgent message is always written before any normal message that
 * was enqueued after it.
 *
 * Messages still queued when the loop stops are discarded.
 */
class WriteScheduler {
public:
  using SendFn = std::function<void(const message::MessagePtr &)>;

  /**
   * @param queue_capacity Capacity of each of the two queues
   * @param send_urgent Writes one message, blocking the loop
   * @param dispatch_normal Starts an independent write and returns at once
   */
  WriteScheduler(size_t queue_capacity, SendFn send_urgent, SendFn dispatch_normal);

  WriteScheduler(const WriteScheduler &) = delete;
  WriteScheduler &operator=(const WriteScheduler &) = delete;

  // False if the selected queue is full or the scheduler is stopped
  bool try_enqueue(message::MessagePtr msg, MessagePriority priority);

  // Runs until stop(); call from exactly one thread
  void run();

  // Idempotent; wakes run()
  void stop();

  bool is_stopped() const { return stopped_.load(std::memory_order_acquire); }

  size_t urgent_size() const { return urgent_.Size(); }
  size_t normal_size() const { return normal_.Size(); }

private:
  // Send every urgent message queued right now; false if stopped meanwhile
  bool drain_urgent();

  util::BoundedQueue<message::MessagePtr> urgent_;
  util::BoundedQueue<message::MessagePtr> normal_;
  SendFn send_urgent_;
  SendFn dispatch_normal_;

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::atomic<bool> stopped_{false};
};

} // namespace network
} // namespace peerlink

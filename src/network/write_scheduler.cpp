// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/write_scheduler.hpp"
#include "util/logging.hpp"

namespace peerlink {
namespace network {

const char *ToString(MessagePriority priority) {
  switch (priority) {
  case MessagePriority::Urgent:
    return "urgent";
  case MessagePriority::Normal:
    return "normal";
  }
  return "unknown";
}

WriteScheduler::WriteScheduler(size_t queue_capacity, SendFn send_urgent,
                               SendFn dispatch_normal)
    : urgent_(queue_capacity), normal_(queue_capacity),
      send_urgent_(std::move(send_urgent)),
      dispatch_normal_(std::move(dispatch_normal)) {}

bool WriteScheduler::try_enqueue(message::MessagePtr msg, MessagePriority priority) {
  if (is_stopped()) {
    return false;
  }

  auto &queue = (priority == MessagePriority::Urgent) ? urgent_ : normal_;
  if (!queue.TryPush(std::move(msg))) {
    return false;
  }

  // Taking the wake mutex orders this push against the loop's predicate
  // check, so the notification cannot be lost
  { std::lock_guard<std::mutex> lock(wake_mutex_); }
  wake_cv_.notify_one();
  return true;
}

void WriteScheduler::run() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(wake_mutex_);
      wake_cv_.wait(lock, [this] {
        return is_stopped() || !urgent_.Empty() || !normal_.Empty();
      });
    }
    if (is_stopped()) {
      break;
    }

    if (auto msg = urgent_.TryPop()) {
      send_urgent_(*msg);
      continue;
    }

    auto msg = normal_.TryPop();
    if (!msg) {
      continue;
    }
    if (!drain_urgent()) {
      break;
    }
    dispatch_normal_(*msg);
  }

  size_t dropped = urgent_.Clear() + normal_.Clear();
  if (dropped > 0) {
    LOG_NET_DEBUG("write scheduler stopped, discarded {} queued message(s)", dropped);
  }
}

bool WriteScheduler::drain_urgent() {
  // Bounded by what is queued now; urgent traffic arriving meanwhile waits
  // for the next iteration
  size_t pending = urgent_.Size();
  for (size_t i = 0; i < pending; ++i) {
    if (is_stopped()) {
      return false;
    }
    auto msg = urgent_.TryPop();
    if (!msg) {
      break;
    }
    send_urgent_(*msg);
  }
  return !is_stopped();
}

void WriteScheduler::stop() {
  if (stopped_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  { std::lock_guard<std::mutex> lock(wake_mutex_); }
  wake_cv_.notify_all();
}

} // namespace network
} // namespace peerlink

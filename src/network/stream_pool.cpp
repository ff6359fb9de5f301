// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/stream_pool.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace peerlink {
namespace network {

StreamPool::StreamPool(size_t max_streams, StreamOpener opener, StreamCallback on_opened)
    : max_streams_(max_streams), opener_(std::move(opener)),
      on_opened_(std::move(on_opened)) {}

AcquireStatus StreamPool::acquire(StreamPtr &out) {
  std::unique_lock<std::mutex> lock(mutex_);

  while (true) {
    if (closed_) {
      return AcquireStatus::Closed;
    }

    if (!idle_.empty()) {
      out = std::move(idle_.front());
      idle_.pop_front();
      return AcquireStatus::Ok;
    }

    if (live_.size() + opening_ < max_streams_) {
      // Reserve the slot so concurrent acquirers cannot overshoot the cap
      // while the open runs unlocked
      ++opening_;
      lock.unlock();
      StreamPtr stream = opener_ ? opener_() : nullptr;
      lock.lock();
      --opening_;

      if (!stream) {
        cv_.notify_all();
        return AcquireStatus::OpenFailed;
      }
      if (closed_) {
        lock.unlock();
        stream->close();
        return AcquireStatus::Closed;
      }

      live_.emplace(stream, false);
      LOG_NET_TRACE("opened stream {} (live={}/{})", stream->id(), live_.size(),
                    max_streams_);
      lock.unlock();

      if (on_opened_) {
        on_opened_(stream);
      }
      out = std::move(stream);
      return AcquireStatus::Ok;
    }

    cv_.wait(lock);
  }
}

bool StreamPool::add(const StreamPtr &stream) {
  if (!stream) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || live_.size() + opening_ >= max_streams_) {
    return false;
  }
  if (!live_.emplace(stream, false).second) {
    return false;
  }
  idle_.push_back(stream);
  cv_.notify_one();
  return true;
}

void StreamPool::release(const StreamPtr &stream) {
  std::unique_lock<std::mutex> lock(mutex_);

  auto it = live_.find(stream);
  if (it == live_.end()) {
    return; // retired while checked out
  }

  if (it->second || closed_) {
    remove_locked(stream);
    lock.unlock();
    stream->close_write();
    cv_.notify_all();
    return;
  }

  idle_.push_back(stream);
  cv_.notify_one();
}

void StreamPool::retire(const StreamPtr &stream) {
  bool was_live = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    was_live = remove_locked(stream);
  }
  if (!was_live) {
    return;
  }

  stream->close_write();
  LOG_NET_DEBUG("retired stream {}", stream->id());
  // A slot opened up: a waiter may now open a fresh stream
  cv_.notify_all();
}

void StreamPool::invalidate(const StreamPtr &stream) {
  std::unique_lock<std::mutex> lock(mutex_);

  auto it = live_.find(stream);
  if (it == live_.end()) {
    return;
  }

  auto idle_it = std::find(idle_.begin(), idle_.end(), stream);
  if (idle_it == idle_.end()) {
    // Checked out: the holder retires it on release
    it->second = true;
    return;
  }

  remove_locked(stream);
  lock.unlock();
  stream->close_write();
  cv_.notify_all();
}

void StreamPool::shutdown() {
  std::deque<StreamPtr> idle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    idle.swap(idle_);
  }
  cv_.notify_all();

  for (const auto &stream : idle) {
    stream->close();
  }
}

size_t StreamPool::live_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_.size() + opening_;
}

size_t StreamPool::idle_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

bool StreamPool::remove_locked(const StreamPtr &stream) {
  if (live_.erase(stream) == 0) {
    return false;
  }
  auto it = std::find(idle_.begin(), idle_.end(), stream);
  if (it != idle_.end()) {
    idle_.erase(it);
  }
  return true;
}

} // namespace network
} // namespace peerlink

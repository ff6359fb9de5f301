// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/stream.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace peerlink {
namespace network {

enum class AcquireStatus {
  Ok,
  OpenFailed, // Below the cap but opening a new stream failed
  Closed      // Pool shut down (peer stopping)
};

/**
 * StreamPool - bounded set of streams to one peer
 *
 * A stream is either idle (owned by the pool) or checked out by exactly
 * one writer. The number of live streams (idle + checked out + being
 * opened) never exceeds max_streams.
 *
 * acquire() order of preference:
 *   1. an idle stream
 *   2. a newly opened stream, if below the cap
 *   3. wait for a stream to be released or retired
 * No open is attempted while at the cap.
 *
 * Streams that fail are retired: closed for writing and removed from the
 * live set permanently.
 */
class StreamPool {
public:
  using StreamOpener = std::function<StreamPtr()>;
  using StreamCallback = std::function<void(const StreamPtr &)>;

  /**
   * @param max_streams Live stream cap
   * @param opener Opens a new outbound stream (nullptr on failure); called
   *               without the pool lock held
   * @param on_opened Invoked for every stream opened by acquire(), before
   *                  it is handed to the caller
   */
  StreamPool(size_t max_streams, StreamOpener opener, StreamCallback on_opened);

  StreamPool(const StreamPool &) = delete;
  StreamPool &operator=(const StreamPool &) = delete;

  // Blocks while at the cap with nothing idle
  AcquireStatus acquire(StreamPtr &out);

  // Register an externally opened stream as idle
  // Returns false if the pool is at the cap or shut down
  bool add(const StreamPtr &stream);

  // Return a healthy stream to the idle set (retires it if it was
  // invalidated while checked out)
  void release(const StreamPtr &stream);

  // Close for writing and drop from the live set; idempotent
  void retire(const StreamPtr &stream);

  // The stream's reader failed: retire now if idle, on release otherwise
  void invalidate(const StreamPtr &stream);

  // Wake all waiters; subsequent acquire() returns Closed
  void shutdown();

  size_t live_count() const;
  size_t idle_count() const;
  size_t max_streams() const { return max_streams_; }

private:
  // Caller holds mutex_; returns true if the stream was live
  bool remove_locked(const StreamPtr &stream);

  const size_t max_streams_;
  StreamOpener opener_;
  StreamCallback on_opened_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<StreamPtr> idle_;
  // Live streams; value is true once the stream's reader has failed
  std::unordered_map<StreamPtr, bool> live_;
  size_t opening_ = 0;
  bool closed_ = false;
};

} // namespace network
} // namespace peerlink

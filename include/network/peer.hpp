// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/dedup_filter.hpp"
#include "network/frame_reader.hpp"
#include "network/message.hpp"
#include "network/metrics.hpp"
#include "network/peer_config.hpp"
#include "network/peer_manager.hpp"
#include "network/stream.hpp"
#include "network/stream_pool.hpp"
#include "network/write_scheduler.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace peerlink {
namespace network {

class Peer;
using PeerPtr = std::shared_ptr<Peer>;

// Outcome of the caller-facing peer operations
enum class PeerResult {
  Success,
  StreamCountExceeded, // add_stream() at the stream cap
  ChannelFull,         // priority queue full, message dropped
  DuplicateMessage,    // dedup filter hit, message not queued
  NotRunning           // peer stopped (or unknown to the manager)
};

const char *ToString(PeerResult result);

// Per-peer counters
// All fields are atomic: they are bumped from reader threads, the writer
// loop and send tasks concurrently
struct PeerStats {
  std::atomic<uint64_t> messages_sent{0};
  std::atomic<uint64_t> bytes_sent{0};
  std::atomic<uint64_t> messages_received{0};
  std::atomic<uint64_t> bytes_received{0};
  std::atomic<uint64_t> duplicates_rejected{0};
  std::atomic<uint64_t> channel_full{0};
  std::atomic<uint64_t> write_failures{0};
  std::atomic<int64_t> last_latency_ns{0};
};

/**
 * Peer - one directly connected remote participant
 *
 * Owns the stream pool, the two outbound queues (via WriteScheduler) and
 * the dedup filter for that peer.
 *
 * Threads:
 *   - one writer thread running the scheduler loop (started by start())
 *   - one reader thread per live stream
 *   - up to max_stream_count sender threads for normal-priority sends,
 *     spawned on demand and retired after SENDER_IDLE_TIMEOUT without work
 * Sender threads belong to this peer alone, so a stalled peer can only
 * delay its own normal traffic.
 * Every thread holds a shared_ptr to the Peer, so the Peer outlives its own
 * work.
 *
 * IMPORTANT: Peer is single-use. start() runs at most once and a stopped
 * peer is never restarted; the manager creates a new Peer instead.
 */
class Peer : public std::enable_shared_from_this<Peer> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  // How long an idle sender thread waits for work before exiting
  static constexpr std::chrono::seconds SENDER_IDLE_TIMEOUT{30};

  /**
   * @param connection Primary connection handle, closed by stop()
   * @param initial_stream Optional first stream (added like add_stream())
   * @param manager Owner; must outlive the peer's threads
   * @throws std::invalid_argument if config.validate() fails
   */
  static PeerPtr create(ConnectionPtr connection, StreamPtr initial_stream,
                        PeerManager &manager, const PeerConfig &config,
                        MetricsSink &metrics);

  Peer(PrivateTag, ConnectionPtr connection, PeerManager &manager,
       const PeerConfig &config, MetricsSink &metrics);
  ~Peer();

  Peer(const Peer &) = delete;
  Peer &operator=(const Peer &) = delete;

  // Launch the writer loop; later calls are ignored
  void start();

  // Signal shutdown and force-close the connection; idempotent and safe
  // from any thread, including the peer's own
  void stop();

  // Wait for the peer's threads to exit (the calling thread is skipped)
  // Call after stop(), from outside the peer's own threads when possible
  void join();

  // Register a stream opened by the remote side and start reading it
  PeerResult add_stream(const StreamPtr &stream);

  // Queue a message for delivery; never blocks
  PeerResult submit(const message::MessagePtr &msg, MessagePriority priority,
                    bool deduplicate);

  const std::string &id() const { return id_; }
  const std::string &address() const { return address_; }

  bool is_running() const { return started_.load() && !stopped_.load(); }
  bool is_stopped() const { return stopped_.load(); }

  // True while any writer/reader/sender thread is still running
  bool has_active_workers();

  // Sender threads currently alive (busy or idle)
  size_t sender_count();

  size_t stream_count() const { return pool_.live_count(); }
  const StreamPool &stream_pool() const { return pool_; }
  const PeerStats &stats() const { return stats_; }
  const DedupFilter &dedup_filter() const { return dedup_; }
  const PeerConfig &config() const { return config_; }

private:
  StreamPtr open_stream();
  bool spawn_reader(const StreamPtr &stream);
  bool spawn_sender();
  void spawn_locked(std::function<void()> fn);

  void write_loop();
  void dispatch_send(const message::MessagePtr &msg);
  void sender_loop();
  void send_message(const message::MessagePtr &msg);

  void read_loop(const StreamPtr &stream);
  void deliver(const message::MessagePtr &msg,
               std::chrono::steady_clock::time_point header_time);
  void log_reader_exit(const FrameReader &reader, FrameStatus status) const;

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  ConnectionPtr connection_;
  PeerManager &manager_;
  MetricsSink &metrics_;
  const PeerConfig config_;
  const std::string id_;
  const std::string address_;

  DedupFilter dedup_;
  StreamPool pool_;
  WriteScheduler scheduler_;
  PeerStats stats_;

  // Thread-safe guards: start() runs once, stop() runs once
  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};

  std::mutex workers_mutex_;
  std::vector<Worker> workers_;

  // Normal sends handed over by the writer loop, drained by sender threads
  std::mutex send_mutex_;
  std::condition_variable send_cv_;
  std::deque<message::MessagePtr> pending_sends_;
  size_t senders_ = 0;
  size_t idle_senders_ = 0;
};

} // namespace network
} // namespace peerlink

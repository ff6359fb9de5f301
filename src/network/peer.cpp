// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <boost/asio/error.hpp>
#include <stdexcept>

namespace peerlink {
namespace network {

const char *ToString(PeerResult result) {
  switch (result) {
  case PeerResult::Success:
    return "success";
  case PeerResult::StreamCountExceeded:
    return "stream count exceeded";
  case PeerResult::ChannelFull:
    return "message channel full";
  case PeerResult::DuplicateMessage:
    return "duplicate message";
  case PeerResult::NotRunning:
    return "peer not running";
  }
  return "unknown";
}

namespace {

int64_t ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(util::GetSteadyTime() -
                                                               since)
      .count();
}

} // namespace

PeerPtr Peer::create(ConnectionPtr connection, StreamPtr initial_stream,
                     PeerManager &manager, const PeerConfig &config,
                     MetricsSink &metrics) {
  if (!connection) {
    throw std::invalid_argument("Peer::create: null connection");
  }
  std::string error = config.validate();
  if (!error.empty()) {
    throw std::invalid_argument("Peer::create: " + error);
  }

  // make_shared first: add_stream() spawns a reader holding shared_from_this()
  auto peer =
      std::make_shared<Peer>(PrivateTag{}, std::move(connection), manager, config, metrics);
  if (initial_stream) {
    PeerResult result = peer->add_stream(initial_stream);
    if (result != PeerResult::Success) {
      LOG_NET_WARN("peer {}: initial stream rejected: {}", peer->id(), ToString(result));
      initial_stream->close();
    }
  }
  return peer;
}

Peer::Peer(PrivateTag, ConnectionPtr connection, PeerManager &manager,
           const PeerConfig &config, MetricsSink &metrics)
    : connection_(std::move(connection)), manager_(manager), metrics_(metrics), config_(config),
      id_(connection_->remote_peer_id()), address_(connection_->remote_address()),
      dedup_(config.dedup_capacity, config.dedup_false_positive_rate),
      pool_(
          config.max_stream_count, [this]() { return open_stream(); },
          [this](const StreamPtr &stream) { spawn_reader(stream); }),
      scheduler_(
          config.message_queue_size,
          [this](const message::MessagePtr &msg) { send_message(msg); },
          [this](const message::MessagePtr &msg) { dispatch_send(msg); }) {}

Peer::~Peer() {
  // Threads hold shared_ptrs, so by now they have all left the
  // peer; stop() and join() only release the connection and OS threads
  stop();
  join();
}

void Peer::start() {
  bool expected = false;
  if (!started_.compare_exchange_strong(expected, true)) {
    LOG_NET_WARN("peer {}: start() called more than once", id_);
    return;
  }

  std::lock_guard<std::mutex> lock(workers_mutex_);
  if (stopped_.load()) {
    return;
  }
  auto self = shared_from_this();
  spawn_locked([self]() { self->write_loop(); });
  LOG_NET_INFO("peer {} started (address={})", id_, address_);
}

void Peer::stop() {
  bool expected = false;
  if (!stopped_.compare_exchange_strong(expected, true)) {
    return;
  }

  LOG_NET_INFO("stopping peer {} (address={})", id_, address_);
  scheduler_.stop();
  pool_.shutdown();
  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    pending_sends_.clear();
  }
  send_cv_.notify_all();
  // Unblocks every reader stuck in read_full()
  connection_->close();
}

void Peer::join() {
  std::vector<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }

  const auto current = std::this_thread::get_id();
  for (auto &worker : workers) {
    if (!worker.thread.joinable()) {
      continue;
    }
    if (worker.thread.get_id() == current) {
      worker.thread.detach();
    } else {
      worker.thread.join();
    }
  }
}

bool Peer::has_active_workers() {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  for (const auto &worker : workers_) {
    if (!worker.done->load()) {
      return true;
    }
  }
  return false;
}

size_t Peer::sender_count() {
  std::lock_guard<std::mutex> lock(send_mutex_);
  return senders_;
}

PeerResult Peer::add_stream(const StreamPtr &stream) {
  if (!stream) {
    return PeerResult::NotRunning;
  }
  if (stopped_.load()) {
    return PeerResult::NotRunning;
  }
  if (!pool_.add(stream)) {
    if (stopped_.load()) {
      return PeerResult::NotRunning;
    }
    LOG_NET_DEBUG("peer {}: rejecting stream {}, {} streams live", id_, stream->id(),
                  pool_.live_count());
    return PeerResult::StreamCountExceeded;
  }

  if (!spawn_reader(stream)) {
    pool_.retire(stream);
    return PeerResult::NotRunning;
  }
  return PeerResult::Success;
}

PeerResult Peer::submit(const message::MessagePtr &msg, MessagePriority priority,
                        bool deduplicate) {
  if (!msg || stopped_.load()) {
    return PeerResult::NotRunning;
  }

  if (deduplicate && msg->needs_dedup() && dedup_.might_contain(msg->content())) {
    stats_.duplicates_rejected.fetch_add(1, std::memory_order_relaxed);
    return PeerResult::DuplicateMessage;
  }

  if (!scheduler_.try_enqueue(msg, priority)) {
    if (scheduler_.is_stopped()) {
      return PeerResult::NotRunning;
    }
    stats_.channel_full.fetch_add(1, std::memory_order_relaxed);
    LOG_NET_TRACE("peer {}: {} queue full, dropping {}", id_, ToString(priority),
                  message::ToString(msg->type()));
    return PeerResult::ChannelFull;
  }

  // Recorded at enqueue time so concurrent duplicate submissions are
  // suppressed before the first copy is written
  if (msg->needs_dedup()) {
    dedup_.record(msg->content());
  }
  return PeerResult::Success;
}

StreamPtr Peer::open_stream() {
  StreamPtr stream = manager_.new_outbound_stream(id_);
  if (!stream) {
    LOG_NET_ERROR("peer {}: creating stream failed", id_);
  }
  return stream;
}

bool Peer::spawn_reader(const StreamPtr &stream) {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  if (stopped_.load()) {
    return false;
  }
  auto self = shared_from_this();
  spawn_locked([self, stream]() { self->read_loop(stream); });
  return true;
}

bool Peer::spawn_sender() {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  if (stopped_.load()) {
    return false;
  }
  auto self = shared_from_this();
  spawn_locked([self]() { self->sender_loop(); });
  return true;
}

void Peer::spawn_locked(std::function<void()> fn) {
  // Reap workers that already finished so long-lived peers with stream
  // churn do not accumulate dead threads
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load() && it->thread.get_id() != std::this_thread::get_id()) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread thread([fn = std::move(fn), done]() {
    fn();
    done->store(true);
  });
  workers_.push_back(Worker{std::move(thread), std::move(done)});
}

void Peer::write_loop() {
  try {
    scheduler_.run();
  } catch (const std::exception &e) {
    LOG_NET_ERROR("peer {}: writer loop failed: {}", id_, e.what());
  }
  LOG_NET_INFO("peer is stopped. peer={}, address={}", id_, address_);
}

void Peer::dispatch_send(const message::MessagePtr &msg) {
  bool grow = false;
  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (stopped_.load()) {
      return;
    }
    pending_sends_.push_back(msg);
    // Grow while work outnumbers idle senders, at most one per stream
    if (pending_sends_.size() > idle_senders_ && senders_ < config_.max_stream_count) {
      ++senders_;
      grow = true;
    }
  }

  if (!grow) {
    send_cv_.notify_one();
    return;
  }
  if (!spawn_sender()) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    --senders_;
  }
}

void Peer::sender_loop() {
  std::unique_lock<std::mutex> lock(send_mutex_);
  for (;;) {
    ++idle_senders_;
    bool has_work = send_cv_.wait_for(lock, SENDER_IDLE_TIMEOUT, [this]() {
      return stopped_.load() || !pending_sends_.empty();
    });
    --idle_senders_;

    if (stopped_.load() || !has_work) {
      --senders_;
      return;
    }

    message::MessagePtr msg = std::move(pending_sends_.front());
    pending_sends_.pop_front();
    lock.unlock();
    send_message(msg);
    lock.lock();
  }
}

void Peer::send_message(const message::MessagePtr &msg) {
  try {
    const auto acquire_start = util::GetSteadyTime();
    StreamPtr stream;
    AcquireStatus status = pool_.acquire(stream);
    if (status == AcquireStatus::Closed) {
      return;
    }
    if (status == AcquireStatus::OpenFailed) {
      if (stopped_.load()) {
        return;
      }
      // No stream can be obtained: the connection is most likely gone
      LOG_NET_ERROR("peer {}: get stream failed, removing neighbor", id_);
      manager_.remove_neighbor(id_);
      return;
    }

    const auto write_start = util::GetSteadyTime();
    const auto &content = msg->content();
    auto timeout = protocol::WriteTimeout(content.size(), config_.min_write_timeout,
                                          config_.write_bytes_per_second);
    auto frame = msg->with_send_time(util::GetTimeNanos()).serialize();

    boost::system::error_code ec = stream->write(frame, write_start + timeout);
    if (ec) {
      stats_.write_failures.fetch_add(1, std::memory_order_relaxed);
      LOG_NET_WARN("peer {}: write of {} ({} bytes) failed on stream {}: {}", id_,
                   message::ToString(msg->type()), frame.size(), stream->id(),
                   ec.message());
      pool_.retire(stream);
      return;
    }

    if (msg->type() == message::MessageType::NewBlock) {
      metrics_.set_gauge(metrics::GET_STREAM_TIME_MS,
                         static_cast<double>(
                             std::chrono::duration_cast<std::chrono::milliseconds>(
                                 write_start - acquire_start)
                                 .count()),
                         {});
      metrics_.set_gauge(metrics::WRITE_STREAM_TIME_MS,
                         static_cast<double>(ElapsedMs(write_start)), {});
    }

    Tags tags{{metrics::TAG_MTYPE, message::ToString(msg->type())}};
    metrics_.add_counter(metrics::BYTE_OUT, static_cast<double>(content.size()), tags);
    metrics_.add_counter(metrics::PACKET_OUT, 1, tags);
    stats_.messages_sent.fetch_add(1, std::memory_order_relaxed);
    stats_.bytes_sent.fetch_add(content.size(), std::memory_order_relaxed);

    pool_.release(stream);
  } catch (const std::exception &e) {
    LOG_NET_ERROR("peer {}: send failed: {}", id_, e.what());
  }
}

void Peer::read_loop(const StreamPtr &stream) {
  FrameReader reader(stream, manager_.chain_id(), config_.max_frame_payload);

  try {
    while (!stopped_.load()) {
      std::optional<message::P2PMessage> decoded;
      FrameStatus status = reader.read_next(decoded);
      if (status != FrameStatus::Ok) {
        log_reader_exit(reader, status);
        break;
      }
      deliver(std::make_shared<const message::P2PMessage>(std::move(*decoded)),
              reader.last_header_time());
    }
  } catch (const std::exception &e) {
    LOG_NET_ERROR("peer {}: reader on stream {} failed: {}", id_, stream->id(), e.what());
  }

  pool_.invalidate(stream);
}

void Peer::deliver(const message::MessagePtr &msg,
                   std::chrono::steady_clock::time_point header_time) {
  const char *mtype = message::ToString(msg->type());
  const auto &content = msg->content();

  if (msg->type() == message::MessageType::NewBlock) {
    metrics_.set_gauge(metrics::BLOCK_RECV_TIME_MS,
                       static_cast<double>(ElapsedMs(header_time)), {});
  }

  Tags tags{{metrics::TAG_MTYPE, mtype}};
  metrics_.add_counter(metrics::BYTE_IN, static_cast<double>(content.size()), tags);
  metrics_.add_counter(metrics::PACKET_IN, 1, tags);
  stats_.messages_received.fetch_add(1, std::memory_order_relaxed);
  stats_.bytes_received.fetch_add(content.size(), std::memory_order_relaxed);

  int64_t latency = util::GetTimeNanos() - msg->send_time_ns();
  stats_.last_latency_ns.store(latency, std::memory_order_relaxed);
  metrics_.set_gauge(metrics::MESSAGE_LATENCY_NS, static_cast<double>(latency),
                     {{metrics::TAG_MTYPE, mtype},
                      {metrics::TAG_FROM, config_.label_for(id_)}});

  // Seen from this peer: do not echo it back
  if (msg->needs_dedup()) {
    dedup_.record(content);
  }

  LOG_NET_TRACE("peer {}: received {} ({} bytes)", id_, mtype, content.size());
  manager_.handle_message(msg, id_);
}

void Peer::log_reader_exit(const FrameReader &reader, FrameStatus status) const {
  const uint64_t stream_id = reader.stream()->id();
  switch (status) {
  case FrameStatus::ReadFailed: {
    const auto &ec = reader.last_error();
    if (stopped_.load() || ec == boost::asio::error::eof ||
        ec == boost::asio::error::operation_aborted) {
      LOG_NET_DEBUG("peer {}: stream {} closed: {}", id_, stream_id, ec.message());
    } else {
      LOG_NET_WARN("peer {}: read header failed on stream {}: {}", id_, stream_id,
                   ec.message());
    }
    break;
  }
  case FrameStatus::ChainIdMismatch:
    LOG_NET_WARN("peer {}: mismatched chainID={} on stream {}", id_,
                 reader.last_chain_id(), stream_id);
    break;
  case FrameStatus::Oversized:
    LOG_NET_WARN("peer {}: frame length {} exceeds limit {} on stream {}", id_,
                 reader.last_length(), config_.max_frame_payload, stream_id);
    break;
  case FrameStatus::DecodeFailed:
    LOG_NET_ERROR("peer {}: parse p2p message failed on stream {}", id_, stream_id);
    break;
  case FrameStatus::Ok:
    break;
  }
}

} // namespace network
} // namespace peerlink

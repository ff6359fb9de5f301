// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/network_manager.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace peerlink {
namespace network {

std::string NetworkManager::Config::validate() const {
  if (node_id.empty()) {
    return "node_id is required";
  }
  if (node_id.size() > StreamHello::MAX_NODE_ID_LENGTH) {
    return "node_id is too long";
  }
  if (io_threads == 0) {
    return "io_threads must be positive";
  }
  if (connect_timeout.count() <= 0) {
    return "connect_timeout_ms must be positive";
  }
  return peer.validate();
}

NetworkManager::NetworkManager(const Config &config, std::shared_ptr<MetricsSink> metrics)
    : config_(config), metrics_(std::move(metrics)),
      transport_(std::make_unique<TcpTransport>(config.io_threads)) {
  std::string problem = config_.validate();
  if (!problem.empty()) {
    throw std::invalid_argument("NetworkManager: " + problem);
  }
  if (!metrics_) {
    metrics_ = std::make_shared<MetricsRegistry>();
  }
}

NetworkManager::~NetworkManager() { stop(); }

bool NetworkManager::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_) {
    return false;
  }

  transport_->run();

  uint16_t advertised_port = 0;
  if (config_.listen_enabled) {
    bool ok = transport_->listen(config_.listen_port, [this](std::shared_ptr<TcpStream> s) {
      on_accept(std::move(s));
    });
    if (!ok) {
      LOG_NET_ERROR("failed to start listener on port {}", config_.listen_port);
      transport_->stop();
      return false;
    }
    advertised_port = transport_->listening_port();
  }
  preamble_ = StreamHello{config_.node_id, advertised_port}.serialize();

  running_ = true;
  LOG_NET_INFO("network manager started (node={}, chain_id={}, port={})", config_.node_id,
               config_.chain_id, advertised_port);
  return true;
}

void NetworkManager::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.exchange(false)) {
    return;
  }
  {
    // Let an add_peer() that saw running_ finish inserting before TakeAll
    std::lock_guard<std::mutex> create_lock(create_mutex_);
  }

  transport_->stop_listening();

  {
    std::lock_guard<std::mutex> pending_lock(pending_mutex_);
    for (const auto &stream : pending_streams_) {
      stream->close();
    }
    pending_streams_.clear();
  }

  std::vector<PeerPtr> peers;
  for (auto &entry : peers_.TakeAll()) {
    peers.push_back(std::move(entry.peer));
  }
  {
    std::lock_guard<std::mutex> retired_lock(retired_mutex_);
    peers.insert(peers.end(), retired_.begin(), retired_.end());
    retired_.clear();
  }

  for (auto &peer : peers) {
    peer->stop();
  }
  for (auto &peer : peers) {
    peer->join();
  }

  transport_->stop();
  LOG_NET_INFO("network manager stopped");
}

std::shared_ptr<TcpConnection>
NetworkManager::make_connection(const std::string &peer_id, const std::string &host,
                                uint16_t port) {
  return std::make_shared<TcpConnection>(*transport_, peer_id, host, port,
                                         config_.connect_timeout, preamble_);
}

PeerPtr NetworkManager::connect_to(const std::string &peer_id, const std::string &host,
                                   uint16_t port) {
  if (!running_) {
    return nullptr;
  }
  if (peer_id == config_.node_id) {
    LOG_NET_WARN("refusing to connect to ourselves ({})", peer_id);
    return nullptr;
  }
  if (auto existing = peers_.Get(peer_id)) {
    return existing->peer;
  }

  auto connection = make_connection(peer_id, host, port);
  StreamPtr stream = connection->open_stream();
  if (!stream) {
    LOG_NET_WARN("failed to connect to peer {} at {}:{}", peer_id, host, port);
    connection->close();
    return nullptr;
  }
  return add_peer(peer_id, connection, stream);
}

PeerResult NetworkManager::accept_stream(const std::string &peer_id,
                                         const std::string &host, uint16_t port,
                                         const StreamPtr &stream) {
  if (!stream) {
    return PeerResult::NotRunning;
  }
  if (!running_ || peer_id == config_.node_id) {
    stream->close();
    return PeerResult::NotRunning;
  }

  if (auto entry = peers_.Get(peer_id)) {
    PeerResult result = entry->peer->add_stream(stream);
    if (result == PeerResult::Success) {
      entry->connection->attach(stream);
    } else {
      LOG_NET_DEBUG("peer {} rejected inbound stream: {}", peer_id, ToString(result));
      stream->close();
    }
    return result;
  }

  auto connection = make_connection(peer_id, host, port);
  connection->attach(stream);
  PeerPtr peer = add_peer(peer_id, connection, stream);
  return peer ? PeerResult::Success : PeerResult::NotRunning;
}

PeerPtr NetworkManager::add_peer(const std::string &peer_id,
                                 const std::shared_ptr<TcpConnection> &connection,
                                 const StreamPtr &stream) {
  std::lock_guard<std::mutex> lock(create_mutex_);

  if (auto existing = peers_.Get(peer_id)) {
    // Lost a race with another connect/accept for the same peer
    PeerResult result = existing->peer->add_stream(stream);
    if (result == PeerResult::Success) {
      existing->connection->attach(stream);
    } else {
      connection->close();
    }
    return existing->peer;
  }
  if (!running_) {
    connection->close();
    return nullptr;
  }

  PeerPtr peer = Peer::create(connection, stream, *this, config_.peer, *metrics_);
  peers_.TryInsert(peer_id, PeerEntry{peer, connection});
  peer->start();
  LOG_NET_INFO("peer {} added ({} peers)", peer_id, peers_.Size());
  return peer;
}

void NetworkManager::on_accept(std::shared_ptr<TcpStream> stream) {
  if (!running_) {
    stream->close();
    return;
  }

  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_streams_.insert(stream);
  }

  // A silent dialer gets connect_timeout to identify itself
  StreamHello::async_read(stream, util::GetSteadyTime() + config_.connect_timeout,
                          [this, stream](std::optional<StreamHello> hello) {
                            on_preamble(stream, hello);
                          });
}

void NetworkManager::on_preamble(const std::shared_ptr<TcpStream> &stream,
                                 const std::optional<StreamHello> &hello) {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_streams_.erase(stream);
  }

  if (!hello) {
    LOG_NET_DEBUG("dropping stream from {}:{}: bad or missing preamble",
                  stream->remote_host(), stream->remote_port());
    stream->close();
    return;
  }

  PeerResult result =
      accept_stream(hello->node_id, stream->remote_host(), hello->listen_port, stream);
  if (result != PeerResult::Success) {
    LOG_NET_DEBUG("inbound stream from {} not accepted: {}", hello->node_id,
                  ToString(result));
  }
}

PeerResult NetworkManager::send_to_peer(const std::string &peer_id,
                                        const message::MessagePtr &msg,
                                        MessagePriority priority, bool deduplicate) {
  auto entry = peers_.Get(peer_id);
  if (!entry) {
    return PeerResult::NotRunning;
  }
  return entry->peer->submit(msg, priority, deduplicate);
}

size_t NetworkManager::broadcast(const message::MessagePtr &msg, MessagePriority priority) {
  size_t accepted = 0;
  for (const auto &entry : peers_.GetAllValues()) {
    PeerResult result = entry.peer->submit(msg, priority, true);
    if (result == PeerResult::Success) {
      ++accepted;
    } else {
      LOG_NET_TRACE("broadcast of {} to {} skipped: {}", message::ToString(msg->type()),
                    entry.peer->id(), ToString(result));
    }
  }
  return accepted;
}

void NetworkManager::set_message_handler(MessageHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  message_handler_ = std::move(handler);
}

PeerPtr NetworkManager::get_peer(const std::string &peer_id) const {
  auto entry = peers_.Get(peer_id);
  return entry ? entry->peer : nullptr;
}

std::vector<PeerPtr> NetworkManager::get_all_peers() const {
  std::vector<PeerPtr> peers;
  for (const auto &entry : peers_.GetAllValues()) {
    peers.push_back(entry.peer);
  }
  return peers;
}

void NetworkManager::handle_message(const message::MessagePtr &msg,
                                    const std::string &sender_id) {
  MessageHandler handler;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler = message_handler_;
  }
  if (!handler) {
    return;
  }

  try {
    handler(msg, sender_id);
  } catch (const std::exception &e) {
    LOG_NET_ERROR("message handler failed for {} from {}: {}",
                  message::ToString(msg->type()), sender_id, e.what());
  }
}

void NetworkManager::remove_neighbor(const std::string &peer_id) {
  auto entry = peers_.Take(peer_id);
  if (!entry) {
    return;
  }

  LOG_NET_INFO("removing neighbor {}", peer_id);
  entry->peer->stop();

  // May run on the peer's own thread: join later, from stop()
  std::lock_guard<std::mutex> lock(retired_mutex_);
  retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                [](const PeerPtr &p) { return !p->has_active_workers(); }),
                 retired_.end());
  retired_.push_back(std::move(entry->peer));
}

StreamPtr NetworkManager::new_outbound_stream(const std::string &peer_id) {
  auto entry = peers_.Get(peer_id);
  if (!entry) {
    return nullptr;
  }
  return entry->connection->open_stream();
}

void to_json(nlohmann::json &j, const NetworkManager::Config &config) {
  j = nlohmann::json{
      {"chain_id", config.chain_id},
      {"node_id", config.node_id},
      {"listen_port", config.listen_port},
      {"listen_enabled", config.listen_enabled},
      {"io_threads", config.io_threads},
      {"connect_timeout_ms", config.connect_timeout.count()},
      {"peer", config.peer},
  };
}

void from_json(const nlohmann::json &j, NetworkManager::Config &config) {
  config.chain_id = j.value("chain_id", config.chain_id);
  config.node_id = j.value("node_id", config.node_id);
  config.listen_port = j.value("listen_port", config.listen_port);
  config.listen_enabled = j.value("listen_enabled", config.listen_enabled);
  config.io_threads = j.value("io_threads", config.io_threads);
  config.connect_timeout = std::chrono::milliseconds(
      j.value("connect_timeout_ms", static_cast<int64_t>(config.connect_timeout.count())));
  if (j.contains("peer")) {
    j.at("peer").get_to(config.peer);
  }
}

std::optional<NetworkManager::Config> LoadNetworkConfig(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_WARN("cannot open network config {}", path);
    return std::nullopt;
  }

  NetworkManager::Config config;
  try {
    nlohmann::json root = nlohmann::json::parse(file);
    from_json(root, config);
  } catch (const nlohmann::json::exception &e) {
    LOG_ERROR("failed to parse network config {}: {}", path, e.what());
    return std::nullopt;
  }

  std::string problem = config.validate();
  if (!problem.empty()) {
    LOG_ERROR("invalid network config {}: {}", path, problem);
    return std::nullopt;
  }
  return config;
}

} // namespace network
} // namespace peerlink

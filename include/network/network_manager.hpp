// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/metrics.hpp"
#include "network/peer.hpp"
#include "network/peer_config.hpp"
#include "network/peer_manager.hpp"
#include "network/protocol.hpp"
#include "network/tcp_transport.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace peerlink {
namespace network {

// Upper-layer delivery callback; runs on a peer's reader thread
using MessageHandler =
    std::function<void(const message::MessagePtr &msg, const std::string &sender_id)>;

/**
 * NetworkManager - owns the transport and every Peer of this node
 *
 * Implements PeerManager for its peers: inbound messages are forwarded to
 * the registered MessageHandler, stream requests are served by the peer's
 * TcpConnection, and remove_neighbor() drops the peer.
 *
 * Threads:
 *   - io_threads run the TCP transport, including inbound preamble reads
 *   - each Peer runs its own writer, reader and sender threads
 */
class NetworkManager : public PeerManager {
public:
  struct Config {
    uint32_t chain_id;    // Local chain identifier (frames with another id are dropped)
    std::string node_id;  // Our identity, sent in the stream preamble (REQUIRED)
    uint16_t listen_port; // 0 = ephemeral port
    bool listen_enabled;  // Accept inbound streams
    size_t io_threads;    // Transport I/O threads
    std::chrono::milliseconds connect_timeout;
    PeerConfig peer;

    Config()
        : chain_id(protocol::chain_id::MAINNET), node_id(""), listen_port(0),
          listen_enabled(false), io_threads(1),
          connect_timeout(protocol::DEFAULT_CONNECT_TIMEOUT) {}

    // Empty string if valid, otherwise the first problem found
    std::string validate() const;
  };

  /**
   * @param config Node configuration
   * @param metrics Observability sink (nullptr = in-process MetricsRegistry)
   * @throws std::invalid_argument if config.validate() fails
   */
  explicit NetworkManager(const Config &config,
                          std::shared_ptr<MetricsSink> metrics = nullptr);
  ~NetworkManager() override;

  NetworkManager(const NetworkManager &) = delete;
  NetworkManager &operator=(const NetworkManager &) = delete;

  bool start();

  /**
   * Stop every peer, then the transport
   * Blocks until peer threads exit; idempotent.
   */
  void stop();

  bool is_running() const { return running_; }

  /**
   * Dial a peer and start it
   * Returns the existing peer if one is already registered under peer_id,
   * nullptr if the dial fails or the manager is not running.
   */
  PeerPtr connect_to(const std::string &peer_id, const std::string &host, uint16_t port);

  /**
   * Route an inbound stream from peer_id (reachable at host:port)
   * Adds it to the existing peer or creates one. A rejected stream is closed.
   */
  PeerResult accept_stream(const std::string &peer_id, const std::string &host,
                           uint16_t port, const StreamPtr &stream);

  // Unknown peers report NotRunning
  PeerResult send_to_peer(const std::string &peer_id, const message::MessagePtr &msg,
                          MessagePriority priority, bool deduplicate);

  // Submit to every peer with dedup on; returns how many accepted it
  size_t broadcast(const message::MessagePtr &msg, MessagePriority priority);

  void set_message_handler(MessageHandler handler);

  PeerPtr get_peer(const std::string &peer_id) const;
  size_t peer_count() const { return peers_.Size(); }
  std::vector<PeerPtr> get_all_peers() const;

  MetricsSink &metrics() { return *metrics_; }
  TcpTransport &transport() { return *transport_; }
  const Config &config() const { return config_; }

  // Bound listening port (0 if not listening)
  uint16_t listening_port() const { return transport_->listening_port(); }

  // PeerManager
  void handle_message(const message::MessagePtr &msg,
                      const std::string &sender_id) override;
  void remove_neighbor(const std::string &peer_id) override;
  StreamPtr new_outbound_stream(const std::string &peer_id) override;
  uint32_t chain_id() const override { return config_.chain_id; }

private:
  struct PeerEntry {
    PeerPtr peer;
    std::shared_ptr<TcpConnection> connection;
  };

  std::shared_ptr<TcpConnection> make_connection(const std::string &peer_id,
                                                 const std::string &host, uint16_t port);
  PeerPtr add_peer(const std::string &peer_id,
                   const std::shared_ptr<TcpConnection> &connection,
                   const StreamPtr &stream);

  void on_accept(std::shared_ptr<TcpStream> stream);
  void on_preamble(const std::shared_ptr<TcpStream> &stream,
                   const std::optional<StreamHello> &hello);

  Config config_;
  std::shared_ptr<MetricsSink> metrics_;
  std::unique_ptr<TcpTransport> transport_;

  util::ThreadSafeMap<std::string, PeerEntry> peers_;

  // Removed peers whose threads may still be winding down
  std::mutex retired_mutex_;
  std::vector<PeerPtr> retired_;

  // Accepted streams still waiting for their preamble
  std::mutex pending_mutex_;
  std::unordered_set<std::shared_ptr<TcpStream>> pending_streams_;

  std::mutex handler_mutex_;
  MessageHandler message_handler_;

  std::vector<uint8_t> preamble_;
  std::atomic<bool> running_{false};
  std::mutex lifecycle_mutex_;
  // Serializes lookup-then-insert of new peers
  std::mutex create_mutex_;
};

void to_json(nlohmann::json &j, const NetworkManager::Config &config);
void from_json(const nlohmann::json &j, NetworkManager::Config &config);

/**
 * Load and validate a NetworkManager::Config from a JSON file
 * Returns nullopt (and logs why) if the file is missing, malformed or invalid
 */
std::optional<NetworkManager::Config> LoadNetworkConfig(const std::string &path);

} // namespace network
} // namespace peerlink

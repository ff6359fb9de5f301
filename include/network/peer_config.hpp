// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace peerlink {
namespace network {

/**
 * PeerConfig - tunables of the per-peer connection layer
 *
 * peer_labels maps remote identities to short human-readable labels used to
 * tag latency metrics (e.g. "node01"); unknown identities are reported
 * as-is.
 */
struct PeerConfig {
  size_t max_stream_count = protocol::DEFAULT_MAX_STREAM_COUNT;
  size_t message_queue_size = protocol::DEFAULT_MESSAGE_QUEUE_SIZE;
  size_t dedup_capacity = protocol::DEFAULT_DEDUP_CAPACITY;
  double dedup_false_positive_rate = protocol::DEFAULT_DEDUP_FP_RATE;
  std::chrono::milliseconds min_write_timeout = protocol::DEFAULT_MIN_WRITE_TIMEOUT;
  size_t write_bytes_per_second = protocol::DEFAULT_WRITE_BYTES_PER_SECOND;
  uint32_t max_frame_payload = protocol::DEFAULT_MAX_FRAME_PAYLOAD;
  std::map<std::string, std::string> peer_labels;

  const std::string &label_for(const std::string &peer_id) const;

  // Empty string if valid, otherwise a description of the first problem
  std::string validate() const;
};

// Every key is optional; missing keys keep their defaults.
// Durations are expressed in milliseconds ("min_write_timeout_ms").
void to_json(nlohmann::json &j, const PeerConfig &config);
void from_json(const nlohmann::json &j, PeerConfig &config);

/**
 * Load and validate a PeerConfig from a JSON file
 * Returns nullopt (and logs why) if the file is missing, malformed or invalid
 */
std::optional<PeerConfig> LoadPeerConfig(const std::string &path);

} // namespace network
} // namespace peerlink

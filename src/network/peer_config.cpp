// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_config.hpp"
#include "util/logging.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace peerlink {
namespace network {

const std::string &PeerConfig::label_for(const std::string &peer_id) const {
  auto it = peer_labels.find(peer_id);
  return it == peer_labels.end() ? peer_id : it->second;
}

std::string PeerConfig::validate() const {
  if (max_stream_count == 0) {
    return "max_stream_count must be positive";
  }
  if (message_queue_size == 0) {
    return "message_queue_size must be positive";
  }
  if (dedup_capacity == 0) {
    return "dedup_capacity must be positive";
  }
  if (!(dedup_false_positive_rate > 0.0 && dedup_false_positive_rate < 1.0)) {
    return "dedup_false_positive_rate must be in (0, 1)";
  }
  if (min_write_timeout.count() <= 0) {
    return "min_write_timeout_ms must be positive";
  }
  if (write_bytes_per_second == 0) {
    return "write_bytes_per_second must be positive";
  }
  if (max_frame_payload < protocol::PAYLOAD_PREFIX_SIZE) {
    return "max_frame_payload is smaller than the payload prefix";
  }
  return {};
}

void to_json(nlohmann::json &j, const PeerConfig &config) {
  j = nlohmann::json{
      {"max_stream_count", config.max_stream_count},
      {"message_queue_size", config.message_queue_size},
      {"dedup_capacity", config.dedup_capacity},
      {"dedup_false_positive_rate", config.dedup_false_positive_rate},
      {"min_write_timeout_ms", config.min_write_timeout.count()},
      {"write_bytes_per_second", config.write_bytes_per_second},
      {"max_frame_payload", config.max_frame_payload},
      {"peer_labels", config.peer_labels},
  };
}

void from_json(const nlohmann::json &j, PeerConfig &config) {
  config.max_stream_count = j.value("max_stream_count", config.max_stream_count);
  config.message_queue_size = j.value("message_queue_size", config.message_queue_size);
  config.dedup_capacity = j.value("dedup_capacity", config.dedup_capacity);
  config.dedup_false_positive_rate =
      j.value("dedup_false_positive_rate", config.dedup_false_positive_rate);
  config.min_write_timeout = std::chrono::milliseconds(
      j.value("min_write_timeout_ms", static_cast<int64_t>(config.min_write_timeout.count())));
  config.write_bytes_per_second =
      j.value("write_bytes_per_second", config.write_bytes_per_second);
  config.max_frame_payload = j.value("max_frame_payload", config.max_frame_payload);
  if (j.contains("peer_labels")) {
    config.peer_labels = j.at("peer_labels").get<std::map<std::string, std::string>>();
  }
}

std::optional<PeerConfig> LoadPeerConfig(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_WARN("cannot open peer config {}", path);
    return std::nullopt;
  }

  PeerConfig config;
  try {
    nlohmann::json root = nlohmann::json::parse(file);
    config = root.get<PeerConfig>();
  } catch (const nlohmann::json::exception &e) {
    LOG_ERROR("failed to parse peer config {}: {}", path, e.what());
    return std::nullopt;
  }

  std::string problem = config.validate();
  if (!problem.empty()) {
    LOG_ERROR("invalid peer config {}: {}", path, problem);
    return std::nullopt;
  }
  return config;
}

} // namespace network
} // namespace peerlink

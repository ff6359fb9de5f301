// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace peerlink {
namespace message {

/**
 * Message types carried by the overlay
 * Values are the 2-byte type field of the payload prefix.
 */
enum class MessageType : uint16_t {
  Ping = 1,
  RoutingTableQuery = 2,
  RoutingTableResponse = 3,
  NewBlock = 4,
  NewBlockHash = 5,
  NewBlockRequest = 6,
  SyncBlockHashRequest = 7,
  SyncBlockHashResponse = 8,
  SyncBlockRequest = 9,
  SyncBlockResponse = 10,
  SyncHeight = 11,
  PublishTx = 12,
};

// Metric/log tag for a message type
const char *ToString(MessageType type);

bool IsKnownMessageType(uint16_t raw);

/**
 * P2PMessage - one codec message
 *
 * Immutable value. content() is the codec payload
 * ([type][version][flags][data]); it is what goes on the wire between the
 * frame header and the send-time trailer, and it is also the key used for
 * dedup and metrics, so it must not depend on the send time.
 */
class P2PMessage {
public:
  P2PMessage(uint32_t chain_id, MessageType type, const std::vector<uint8_t> &data,
             bool needs_dedup = false);

  uint32_t chain_id() const { return chain_id_; }
  MessageType type() const { return type_; }
  uint8_t version() const { return content_[2]; }
  uint8_t flags() const { return content_[3]; }
  bool needs_dedup() const { return (flags() & protocol::FLAG_DEDUP) != 0; }

  const std::vector<uint8_t> &content() const { return content_; }
  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(content_).subspan(protocol::PAYLOAD_PREFIX_SIZE);
  }

  // Sender wall-clock time in nanoseconds (0 until stamped)
  int64_t send_time_ns() const { return send_time_ns_; }

  // Copy of this message stamped with the given send time
  P2PMessage with_send_time(int64_t now_ns) const;

  // Full frame: header, payload, send-time trailer
  std::vector<uint8_t> serialize() const;

  // Size of serialize() without building it
  size_t frame_size() const {
    return protocol::FRAME_HEADER_SIZE + content_.size() + protocol::SEND_TIME_SIZE;
  }

  /**
   * Decode a codec payload received under the given chain id
   * Returns nullopt if the prefix is truncated or the type is unknown.
   */
  static std::optional<P2PMessage> ParsePayload(uint32_t chain_id,
                                                std::span<const uint8_t> payload,
                                                int64_t send_time_ns);

private:
  P2PMessage() = default;

  uint32_t chain_id_ = 0;
  MessageType type_ = MessageType::Ping;
  std::vector<uint8_t> content_;
  int64_t send_time_ns_ = 0;
};

using MessagePtr = std::shared_ptr<const P2PMessage>;

/**
 * Decode a complete frame (header + payload + send-time trailer)
 * Returns nullopt if the buffer is shorter than the header, the length
 * field does not match the buffer, or the payload fails to decode.
 */
std::optional<P2PMessage> ParseFrame(std::span<const uint8_t> frame);

} // namespace message
} // namespace peerlink

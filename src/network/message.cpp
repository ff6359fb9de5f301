// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message.hpp"
#include "util/endian.hpp"
#include <algorithm>

namespace peerlink {
namespace message {

const char *ToString(MessageType type) {
  switch (type) {
  case MessageType::Ping:
    return "Ping";
  case MessageType::RoutingTableQuery:
    return "RoutingTableQuery";
  case MessageType::RoutingTableResponse:
    return "RoutingTableResponse";
  case MessageType::NewBlock:
    return "NewBlock";
  case MessageType::NewBlockHash:
    return "NewBlockHash";
  case MessageType::NewBlockRequest:
    return "NewBlockRequest";
  case MessageType::SyncBlockHashRequest:
    return "SyncBlockHashRequest";
  case MessageType::SyncBlockHashResponse:
    return "SyncBlockHashResponse";
  case MessageType::SyncBlockRequest:
    return "SyncBlockRequest";
  case MessageType::SyncBlockResponse:
    return "SyncBlockResponse";
  case MessageType::SyncHeight:
    return "SyncHeight";
  case MessageType::PublishTx:
    return "PublishTx";
  }
  return "Unknown";
}

bool IsKnownMessageType(uint16_t raw) {
  return raw >= static_cast<uint16_t>(MessageType::Ping) &&
         raw <= static_cast<uint16_t>(MessageType::PublishTx);
}

P2PMessage::P2PMessage(uint32_t chain_id, MessageType type,
                       const std::vector<uint8_t> &data, bool needs_dedup)
    : chain_id_(chain_id), type_(type) {
  content_.resize(protocol::PAYLOAD_PREFIX_SIZE + data.size());
  endian::WriteBE16(content_.data(), static_cast<uint16_t>(type));
  content_[2] = protocol::MESSAGE_VERSION;
  content_[3] = needs_dedup ? protocol::FLAG_DEDUP : 0;
  std::copy(data.begin(), data.end(), content_.begin() + protocol::PAYLOAD_PREFIX_SIZE);
}

P2PMessage P2PMessage::with_send_time(int64_t now_ns) const {
  P2PMessage stamped(*this);
  stamped.send_time_ns_ = now_ns;
  return stamped;
}

std::vector<uint8_t> P2PMessage::serialize() const {
  std::vector<uint8_t> frame(frame_size());

  protocol::FrameHeader header(chain_id_, static_cast<uint32_t>(content_.size()));
  auto header_bytes = header.serialize();
  std::copy(header_bytes.begin(), header_bytes.end(), frame.begin());
  std::copy(content_.begin(), content_.end(),
            frame.begin() + protocol::FRAME_HEADER_SIZE);
  endian::WriteBE64(frame.data() + protocol::FRAME_HEADER_SIZE + content_.size(),
                    static_cast<uint64_t>(send_time_ns_));
  return frame;
}

std::optional<P2PMessage> P2PMessage::ParsePayload(uint32_t chain_id,
                                                   std::span<const uint8_t> payload,
                                                   int64_t send_time_ns) {
  if (payload.size() < protocol::PAYLOAD_PREFIX_SIZE) {
    return std::nullopt;
  }

  uint16_t raw_type = endian::ReadBE16(payload.data());
  if (!IsKnownMessageType(raw_type)) {
    return std::nullopt;
  }

  P2PMessage msg;
  msg.chain_id_ = chain_id;
  msg.type_ = static_cast<MessageType>(raw_type);
  msg.content_.assign(payload.begin(), payload.end());
  msg.send_time_ns_ = send_time_ns;
  return msg;
}

std::optional<P2PMessage> ParseFrame(std::span<const uint8_t> frame) {
  if (frame.size() < protocol::FRAME_HEADER_SIZE + protocol::SEND_TIME_SIZE) {
    return std::nullopt;
  }

  auto header = protocol::FrameHeader::deserialize(frame.data());
  size_t expected = protocol::FRAME_HEADER_SIZE + static_cast<size_t>(header.length) +
                    protocol::SEND_TIME_SIZE;
  if (frame.size() != expected) {
    return std::nullopt;
  }

  auto payload = frame.subspan(protocol::FRAME_HEADER_SIZE, header.length);
  auto send_time = static_cast<int64_t>(
      endian::ReadBE64(frame.data() + protocol::FRAME_HEADER_SIZE + header.length));
  return P2PMessage::ParsePayload(header.chain_id, payload, send_time);
}

} // namespace message
} // namespace peerlink

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/frame_reader.hpp"
#include "network/protocol.hpp"
#include "util/endian.hpp"
#include "util/time.hpp"
#include <array>

namespace peerlink {
namespace network {

const char *ToString(FrameStatus status) {
  switch (status) {
  case FrameStatus::Ok:
    return "ok";
  case FrameStatus::ReadFailed:
    return "read failed";
  case FrameStatus::ChainIdMismatch:
    return "chain id mismatch";
  case FrameStatus::Oversized:
    return "oversized frame";
  case FrameStatus::DecodeFailed:
    return "decode failed";
  }
  return "unknown";
}

FrameReader::FrameReader(StreamPtr stream, uint32_t chain_id, uint32_t max_payload)
    : stream_(std::move(stream)), chain_id_(chain_id), max_payload_(max_payload) {}

FrameStatus FrameReader::read_next(std::optional<message::P2PMessage> &msg) {
  msg.reset();

  std::array<uint8_t, protocol::FRAME_HEADER_SIZE> header_bytes{};
  last_error_ = stream_->read_full(header_bytes.data(), header_bytes.size());
  if (last_error_) {
    return FrameStatus::ReadFailed;
  }

  last_header_time_ = util::GetSteadyTime();
  auto header = protocol::FrameHeader::deserialize(header_bytes.data());
  last_chain_id_ = header.chain_id;
  last_length_ = header.length;

  if (header.chain_id != chain_id_) {
    return FrameStatus::ChainIdMismatch;
  }
  if (header.length > max_payload_) {
    return FrameStatus::Oversized;
  }

  // Payload followed by the send-time trailer
  body_.resize(static_cast<size_t>(header.length) + protocol::SEND_TIME_SIZE);
  last_error_ = stream_->read_full(body_.data(), body_.size());
  if (last_error_) {
    return FrameStatus::ReadFailed;
  }

  auto send_time = static_cast<int64_t>(endian::ReadBE64(body_.data() + header.length));
  std::span<const uint8_t> payload(body_.data(), header.length);
  msg = message::P2PMessage::ParsePayload(header.chain_id, payload, send_time);
  if (!msg) {
    return FrameStatus::DecodeFailed;
  }

  ++frames_read_;
  return FrameStatus::Ok;
}

} // namespace network
} // namespace peerlink

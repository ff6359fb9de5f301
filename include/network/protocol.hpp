// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace peerlink {
namespace protocol {

// Chain identifiers - a frame is only accepted by a node configured for the
// same chain
namespace chain_id {
constexpr uint32_t MAINNET = 1024;
constexpr uint32_t TESTNET = 1023;
constexpr uint32_t DEVNET = 1020;
} // namespace chain_id

// Frame layout on a stream:
//   [4B chainID][4B length][length B payload][8B sendTimeNanos]
// All integers big-endian. The trailing send time is outside the codec
// payload and only feeds latency measurement.
constexpr size_t CHAIN_ID_BEGIN = 0;
constexpr size_t CHAIN_ID_END = 4;
constexpr size_t LENGTH_BEGIN = 4;
constexpr size_t LENGTH_END = 8;
constexpr size_t FRAME_HEADER_SIZE = 8;
constexpr size_t SEND_TIME_SIZE = 8;

// Codec payload prefix: [2B messageType][1B version][1B flags]
constexpr size_t PAYLOAD_PREFIX_SIZE = 4;
constexpr uint8_t MESSAGE_VERSION = 1;
constexpr uint8_t FLAG_DEDUP = 0x01;

// Upper bound on a single payload; larger length fields are treated as a
// protocol violation before anything is allocated
constexpr uint32_t DEFAULT_MAX_FRAME_PAYLOAD = 32 * 1024 * 1024;

// Per-peer limits
constexpr size_t DEFAULT_MAX_STREAM_COUNT = 8;
constexpr size_t DEFAULT_MESSAGE_QUEUE_SIZE = 1024;

// Dedup filter sizing
constexpr size_t DEFAULT_DEDUP_CAPACITY = 100000;
constexpr double DEFAULT_DEDUP_FP_RATE = 0.001;

// Write deadline = max(MIN_WRITE_TIMEOUT, bytes / WRITE_BYTES_PER_SECOND)
constexpr std::chrono::milliseconds DEFAULT_MIN_WRITE_TIMEOUT{1000};
constexpr size_t DEFAULT_WRITE_BYTES_PER_SECOND = 5 * 1024; // 5 KB/s floor

constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{10000};

// Fixed 8-byte frame header
struct FrameHeader {
  uint32_t chain_id;
  uint32_t length;

  FrameHeader() : chain_id(0), length(0) {}
  FrameHeader(uint32_t chain, uint32_t len) : chain_id(chain), length(len) {}

  std::array<uint8_t, FRAME_HEADER_SIZE> serialize() const;
  static FrameHeader deserialize(const uint8_t *data);
};

// Write timeout proportional to frame size
std::chrono::milliseconds WriteTimeout(size_t bytes,
                                       std::chrono::milliseconds min_timeout,
                                       size_t bytes_per_second);

} // namespace protocol
} // namespace peerlink

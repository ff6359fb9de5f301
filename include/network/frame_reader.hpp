// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/stream.hpp"
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace peerlink {
namespace network {

enum class FrameStatus {
  Ok,
  ReadFailed,      // I/O error or EOF mid-frame
  ChainIdMismatch, // frame sent for another chain
  Oversized,       // length field above the configured maximum
  DecodeFailed     // payload rejected by the codec
};

const char *ToString(FrameStatus status);

/**
 * FrameReader - pulls frames off one stream
 *
 *   [4B chainID][4B length][length B payload][8B sendTimeNanos]
 *
 * The header is read and validated before the body is allocated. Any
 * status other than Ok leaves the stream at an unknown position, so the
 * caller must stop reading from it.
 */
class FrameReader {
public:
  FrameReader(StreamPtr stream, uint32_t chain_id, uint32_t max_payload);

  // Blocks until one frame is read or fails; msg is set only on Ok
  FrameStatus read_next(std::optional<message::P2PMessage> &msg);

  // Chain id of the last rejected header (ChainIdMismatch diagnostics)
  uint32_t last_chain_id() const { return last_chain_id_; }
  // Length field of the last header
  uint32_t last_length() const { return last_length_; }
  // I/O error behind the last ReadFailed
  const boost::system::error_code &last_error() const { return last_error_; }

  // When the last header finished arriving
  std::chrono::steady_clock::time_point last_header_time() const {
    return last_header_time_;
  }

  uint64_t frames_read() const { return frames_read_; }

  const StreamPtr &stream() const { return stream_; }

private:
  StreamPtr stream_;
  const uint32_t chain_id_;
  const uint32_t max_payload_;

  std::vector<uint8_t> body_;
  uint32_t last_chain_id_ = 0;
  uint32_t last_length_ = 0;
  boost::system::error_code last_error_;
  std::chrono::steady_clock::time_point last_header_time_{};
  uint64_t frames_read_ = 0;
};

} // namespace network
} // namespace peerlink

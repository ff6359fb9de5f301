// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/protocol.hpp"
#include "util/endian.hpp"
#include <algorithm>

namespace peerlink {
namespace protocol {

std::array<uint8_t, FRAME_HEADER_SIZE> FrameHeader::serialize() const {
  std::array<uint8_t, FRAME_HEADER_SIZE> out{};
  endian::WriteBE32(out.data() + CHAIN_ID_BEGIN, chain_id);
  endian::WriteBE32(out.data() + LENGTH_BEGIN, length);
  return out;
}

FrameHeader FrameHeader::deserialize(const uint8_t *data) {
  return FrameHeader(endian::ReadBE32(data + CHAIN_ID_BEGIN),
                     endian::ReadBE32(data + LENGTH_BEGIN));
}

std::chrono::milliseconds WriteTimeout(size_t bytes,
                                       std::chrono::milliseconds min_timeout,
                                       size_t bytes_per_second) {
  if (bytes_per_second == 0) {
    return min_timeout;
  }
  auto proportional = std::chrono::milliseconds(
      static_cast<int64_t>(bytes * 1000 / bytes_per_second));
  return std::max(min_timeout, proportional);
}

} // namespace protocol
} // namespace peerlink

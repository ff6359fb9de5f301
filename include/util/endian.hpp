// Copyright (c) 2014-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

// Frame fields are big-endian (network byte order) on the wire.
namespace endian {

inline uint16_t byteswap16(uint16_t x) { return (x >> 8) | (x << 8); }

inline uint32_t byteswap32(uint32_t x) {
  return ((x >> 24) & 0x000000FF) | ((x >> 8) & 0x0000FF00) |
         ((x << 8) & 0x00FF0000) | ((x << 24) & 0xFF000000);
}

inline uint64_t byteswap64(uint64_t x) {
  return (static_cast<uint64_t>(byteswap32(static_cast<uint32_t>(x))) << 32) |
         byteswap32(static_cast<uint32_t>(x >> 32));
}

inline uint16_t ReadBE16(const uint8_t *ptr) {
  uint16_t result;
  std::memcpy(&result, ptr, sizeof(result));
  if constexpr (std::endian::native == std::endian::little) {
    result = byteswap16(result);
  }
  return result;
}

inline uint32_t ReadBE32(const uint8_t *ptr) {
  uint32_t result;
  std::memcpy(&result, ptr, sizeof(result));
  if constexpr (std::endian::native == std::endian::little) {
    result = byteswap32(result);
  }
  return result;
}

inline uint64_t ReadBE64(const uint8_t *ptr) {
  uint64_t result;
  std::memcpy(&result, ptr, sizeof(result));
  if constexpr (std::endian::native == std::endian::little) {
    result = byteswap64(result);
  }
  return result;
}

inline void WriteBE16(uint8_t *ptr, uint16_t value) {
  if constexpr (std::endian::native == std::endian::little) {
    value = byteswap16(value);
  }
  std::memcpy(ptr, &value, sizeof(value));
}

inline void WriteBE32(uint8_t *ptr, uint32_t value) {
  if constexpr (std::endian::native == std::endian::little) {
    value = byteswap32(value);
  }
  std::memcpy(ptr, &value, sizeof(value));
}

inline void WriteBE64(uint8_t *ptr, uint64_t value) {
  if constexpr (std::endian::native == std::endian::little) {
    value = byteswap64(value);
  }
  std::memcpy(ptr, &value, sizeof(value));
}

// Murmur3 consumes its blocks little-endian regardless of host order.
inline uint32_t ReadLE32(const uint8_t *ptr) {
  uint32_t result;
  std::memcpy(&result, ptr, sizeof(result));
  if constexpr (std::endian::native == std::endian::big) {
    result = byteswap32(result);
  }
  return result;
}

} // namespace endian

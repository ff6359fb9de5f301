// Copyright (c) 2012-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/bloom.hpp"
#include "util/endian.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace peerlink {
namespace util {

static constexpr double LN2SQUARED = 0.4804530139182014246671025263266649717305529515945455;
static constexpr double LN2 = 0.6931471805599453094172321214581765680755001343602552;
static constexpr unsigned int MAX_HASH_FUNCS = 50;

static inline uint32_t rotl32(uint32_t x, int8_t r) {
  return (x << r) | (x >> (32 - r));
}

uint32_t MurmurHash3(uint32_t seed, std::span<const uint8_t> data) {
  uint32_t h1 = seed;
  const uint32_t c1 = 0xcc9e2d51;
  const uint32_t c2 = 0x1b873593;

  const size_t nblocks = data.size() / 4;

  for (size_t i = 0; i < nblocks; ++i) {
    uint32_t k1 = endian::ReadLE32(data.data() + i * 4);

    k1 *= c1;
    k1 = rotl32(k1, 15);
    k1 *= c2;

    h1 ^= k1;
    h1 = rotl32(h1, 13);
    h1 = h1 * 5 + 0xe6546b64;
  }

  const uint8_t *tail = data.data() + nblocks * 4;
  uint32_t k1 = 0;

  switch (data.size() & 3) {
  case 3:
    k1 ^= static_cast<uint32_t>(tail[2]) << 16;
    [[fallthrough]];
  case 2:
    k1 ^= static_cast<uint32_t>(tail[1]) << 8;
    [[fallthrough]];
  case 1:
    k1 ^= tail[0];
    k1 *= c1;
    k1 = rotl32(k1, 15);
    k1 *= c2;
    h1 ^= k1;
  }

  // Finalization
  h1 ^= static_cast<uint32_t>(data.size());
  h1 ^= h1 >> 16;
  h1 *= 0x85ebca6b;
  h1 ^= h1 >> 13;
  h1 *= 0xc2b2ae35;
  h1 ^= h1 >> 16;

  return h1;
}

BloomFilter::BloomFilter(size_t elements, double fp_rate, uint32_t tweak)
    : hash_funcs_(0), tweak_(tweak) {
  if (elements == 0) {
    throw std::invalid_argument("bloom filter element count must be positive");
  }
  if (!(fp_rate > 0.0 && fp_rate < 1.0)) {
    throw std::invalid_argument("bloom filter false-positive rate must be in (0, 1)");
  }

  double bits = -1.0 / LN2SQUARED * static_cast<double>(elements) * std::log(fp_rate);
  size_t bytes = std::max<size_t>(1, static_cast<size_t>(bits / 8));
  data_.assign(bytes, 0);

  double funcs = static_cast<double>(data_.size() * 8) / static_cast<double>(elements) * LN2;
  hash_funcs_ = std::clamp<unsigned int>(static_cast<unsigned int>(funcs), 1, MAX_HASH_FUNCS);
}

size_t BloomFilter::bit_index(unsigned int hash_num, std::span<const uint8_t> key) const {
  // 0xFBA4C795 gives reasonable bit differences between hash_num values
  return MurmurHash3(hash_num * 0xFBA4C795 + tweak_, key) % (data_.size() * 8);
}

void BloomFilter::insert(std::span<const uint8_t> key) {
  for (unsigned int i = 0; i < hash_funcs_; ++i) {
    size_t index = bit_index(i, key);
    data_[index >> 3] |= static_cast<uint8_t>(1 << (7 & index));
  }
}

bool BloomFilter::contains(std::span<const uint8_t> key) const {
  for (unsigned int i = 0; i < hash_funcs_; ++i) {
    size_t index = bit_index(i, key);
    if (!(data_[index >> 3] & (1 << (7 & index)))) {
      return false;
    }
  }
  return true;
}

} // namespace util
} // namespace peerlink

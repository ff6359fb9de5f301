// Copyright (c) 2012-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace peerlink {
namespace util {

/**
 * MurmurHash3 (x86, 32-bit) as used by BIP37 bloom filters
 */
uint32_t MurmurHash3(uint32_t seed, std::span<const uint8_t> data);

/**
 * Fixed-size probabilistic set
 *
 * Sized from an expected element count and a target false-positive rate
 * using the standard optimum:
 *   bits   = -n * ln(p) / ln(2)^2
 *   hashes = bits / n * ln(2)
 *
 * No false negatives for inserted items. The false-positive rate holds
 * while the number of inserted items stays at or below the sizing count;
 * callers are expected to bound insertions themselves.
 *
 * Not thread-safe.
 */
class BloomFilter {
public:
  /**
   * @param elements Number of items the filter is sized for (> 0)
   * @param fp_rate Target false-positive rate in (0, 1)
   * @param tweak Seed mixed into every hash function
   * @throws std::invalid_argument on out-of-range parameters
   */
  BloomFilter(size_t elements, double fp_rate, uint32_t tweak = 0);

  void insert(std::span<const uint8_t> key);
  bool contains(std::span<const uint8_t> key) const;

  void insert(const std::vector<uint8_t> &key) { insert(std::span<const uint8_t>(key)); }
  bool contains(const std::vector<uint8_t> &key) const {
    return contains(std::span<const uint8_t>(key));
  }

  size_t size_bytes() const { return data_.size(); }
  unsigned int hash_funcs() const { return hash_funcs_; }

private:
  size_t bit_index(unsigned int hash_num, std::span<const uint8_t> key) const;

  std::vector<uint8_t> data_;
  unsigned int hash_funcs_;
  uint32_t tweak_;
};

} // namespace util
} // namespace peerlink

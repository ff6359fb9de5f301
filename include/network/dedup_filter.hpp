// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/bloom.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>

namespace peerlink {
namespace network {

/**
 * DedupFilter - recently seen message contents
 *
 * A bloom filter sized for `capacity` items. Once `capacity` items have
 * been recorded, the next record() swaps in a fresh empty filter and
 * restarts the count, so memory stays bounded at the cost of occasionally
 * re-accepting a message seen just before the reset.
 *
 * The filter and its item count are guarded by a single mutex and always
 * change together.
 */
class DedupFilter {
public:
  DedupFilter(size_t capacity, double false_positive_rate);

  DedupFilter(const DedupFilter &) = delete;
  DedupFilter &operator=(const DedupFilter &) = delete;

  void record(std::span<const uint8_t> content);
  bool might_contain(std::span<const uint8_t> content) const;

  // Items recorded since the last reset
  size_t item_count() const;
  // Number of resets since construction
  uint64_t reset_count() const;

  size_t capacity() const { return capacity_; }

private:
  const size_t capacity_;
  const double false_positive_rate_;

  mutable std::mutex mutex_;
  std::unique_ptr<util::BloomFilter> filter_;
  size_t item_count_ = 0;
  uint64_t reset_count_ = 0;
};

} // namespace network
} // namespace peerlink

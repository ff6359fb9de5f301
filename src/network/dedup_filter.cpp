// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/dedup_filter.hpp"
#include "util/logging.hpp"

namespace peerlink {
namespace network {

DedupFilter::DedupFilter(size_t capacity, double false_positive_rate)
    : capacity_(capacity), false_positive_rate_(false_positive_rate),
      filter_(std::make_unique<util::BloomFilter>(capacity, false_positive_rate)) {}

void DedupFilter::record(std::span<const uint8_t> content) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (item_count_ >= capacity_) {
    filter_ = std::make_unique<util::BloomFilter>(capacity_, false_positive_rate_);
    item_count_ = 0;
    ++reset_count_;
    LOG_NET_DEBUG("dedup filter reached {} items, reset (resets={})", capacity_,
                  reset_count_);
  }

  filter_->insert(content);
  ++item_count_;
}

bool DedupFilter::might_contain(std::span<const uint8_t> content) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return filter_->contains(content);
}

size_t DedupFilter::item_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return item_count_;
}

uint64_t DedupFilter::reset_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reset_count_;
}

} // namespace network
} // namespace peerlink

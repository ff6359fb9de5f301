// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>

namespace peerlink {
namespace util {

// 0 means mock time is disabled
static std::atomic<int64_t> g_mock_time_ns{0};

int64_t GetTimeNanos() {
  int64_t mock = g_mock_time_ns.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }

  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  return std::chrono::steady_clock::now();
}

void SetMockTimeNanos(int64_t nanos) {
  g_mock_time_ns.store(nanos, std::memory_order_relaxed);
}

int64_t GetMockTimeNanos() {
  return g_mock_time_ns.load(std::memory_order_relaxed);
}

} // namespace util
} // namespace peerlink

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace peerlink {
namespace util {

/**
 * Mockable wall clock for send-time stamps and latency measurement
 *
 * Frames carry the sender's wall-clock time in nanoseconds since the Unix
 * epoch. Production code calls GetTimeNanos(); tests pin it with
 * SetMockTimeNanos() so latency values are deterministic.
 *
 * Deadlines and elapsed-time measurements never use this clock; they use
 * std::chrono::steady_clock through GetSteadyTime().
 */

/**
 * Current wall-clock time in nanoseconds since the epoch
 * Returns the mock value if one is set
 */
int64_t GetTimeNanos();

/**
 * Current steady clock time point (never mocked)
 */
std::chrono::steady_clock::time_point GetSteadyTime();

/**
 * Set mock wall-clock time in nanoseconds (0 disables mocking)
 */
void SetMockTimeNanos(int64_t nanos);

/**
 * Current mock setting (0 if real time is in use)
 */
int64_t GetMockTimeNanos();

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t nanos) : previous_(GetMockTimeNanos()) {
    SetMockTimeNanos(nanos);
  }

  ~MockTimeScope() { SetMockTimeNanos(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_;
};

} // namespace util
} // namespace peerlink

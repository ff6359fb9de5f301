// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace peerlink {
namespace network {

// Metric names emitted by the peer layer
namespace metrics {
constexpr const char *BYTE_IN = "byte_in";
constexpr const char *PACKET_IN = "packet_in";
constexpr const char *BYTE_OUT = "byte_out";
constexpr const char *PACKET_OUT = "packet_out";
constexpr const char *MESSAGE_LATENCY_NS = "message_latency_ns";
constexpr const char *GET_STREAM_TIME_MS = "get_stream_time_ms";
constexpr const char *WRITE_STREAM_TIME_MS = "write_stream_time_ms";
constexpr const char *BLOCK_RECV_TIME_MS = "block_recv_time_ms";

// Tag keys
constexpr const char *TAG_MTYPE = "mtype";
constexpr const char *TAG_FROM = "from";
} // namespace metrics

using Tags = std::map<std::string, std::string>;

// MetricsSink - observability backend consumed by the peer layer
class MetricsSink {
public:
  virtual ~MetricsSink() = default;

  virtual void add_counter(const std::string &name, double value, const Tags &tags) = 0;
  virtual void set_gauge(const std::string &name, double value, const Tags &tags) = 0;
};

// Discards everything
class NullMetrics : public MetricsSink {
public:
  void add_counter(const std::string &, double, const Tags &) override {}
  void set_gauge(const std::string &, double, const Tags &) override {}
};

/**
 * MetricsRegistry - in-process MetricsSink
 *
 * Counters accumulate, gauges keep the last value. Series are keyed by
 * (name, tags). All methods are thread-safe.
 */
class MetricsRegistry : public MetricsSink {
public:
  void add_counter(const std::string &name, double value, const Tags &tags) override;
  void set_gauge(const std::string &name, double value, const Tags &tags) override;

  // 0 if the series does not exist
  double counter(const std::string &name, const Tags &tags = {}) const;
  double gauge(const std::string &name, const Tags &tags = {}) const;
  bool has_gauge(const std::string &name, const Tags &tags = {}) const;

  // Sum of a counter over every tag set
  double counter_total(const std::string &name) const;

  // {"counters": [{"name":..,"tags":{..},"value":..}], "gauges": [...]}
  nlohmann::json to_json() const;

  void clear();

private:
  using SeriesKey = std::pair<std::string, Tags>;

  mutable std::mutex mutex_;
  std::map<SeriesKey, double> counters_;
  std::map<SeriesKey, double> gauges_;
};

} // namespace network
} // namespace peerlink

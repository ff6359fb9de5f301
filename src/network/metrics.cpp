// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/metrics.hpp"
#include "util/logging.hpp"

namespace peerlink {
namespace network {

void MetricsRegistry::add_counter(const std::string &name, double value, const Tags &tags) {
  if (value < 0) {
    LOG_METRICS_WARN("ignoring negative increment {} for counter {}", value, name);
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  counters_[{name, tags}] += value;
}

void MetricsRegistry::set_gauge(const std::string &name, double value, const Tags &tags) {
  std::lock_guard<std::mutex> lock(mutex_);
  gauges_[{name, tags}] = value;
}

double MetricsRegistry::counter(const std::string &name, const Tags &tags) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counters_.find({name, tags});
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricsRegistry::gauge(const std::string &name, const Tags &tags) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = gauges_.find({name, tags});
  return it == gauges_.end() ? 0.0 : it->second;
}

bool MetricsRegistry::has_gauge(const std::string &name, const Tags &tags) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return gauges_.count({name, tags}) > 0;
}

double MetricsRegistry::counter_total(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  double total = 0;
  for (const auto &[key, value] : counters_) {
    if (key.first == name) {
      total += value;
    }
  }
  return total;
}

nlohmann::json MetricsRegistry::to_json() const {
  using json = nlohmann::json;

  auto dump = [](const std::map<SeriesKey, double> &series) {
    json out = json::array();
    for (const auto &[key, value] : series) {
      json entry;
      entry["name"] = key.first;
      entry["tags"] = json::object();
      for (const auto &[tag, tag_value] : key.second) {
        entry["tags"][tag] = tag_value;
      }
      entry["value"] = value;
      out.push_back(std::move(entry));
    }
    return out;
  };

  std::lock_guard<std::mutex> lock(mutex_);
  json root;
  root["counters"] = dump(counters_);
  root["gauges"] = dump(gauges_);
  return root;
}

void MetricsRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_.clear();
  gauges_.clear();
  LOG_METRICS_TRACE("metrics registry cleared");
}

} // namespace network
} // namespace peerlink

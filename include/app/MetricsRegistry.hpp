#pragma once
#include <atomic>
#include <compare>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>
#include "model/Metric.hpp"

namespace rtspmon::app {

// Current value of every (name, label set) ever written.
//
// Values live in per-key atomics so set/increment never tear and readers
// never wait on a probe. The key map itself is guarded by a shared mutex that
// is held exclusively only while a new key is inserted; keys are never removed.
class MetricsRegistry {
public:
  MetricsRegistry() = default;
  MetricsRegistry(const MetricsRegistry&) = delete;
  MetricsRegistry& operator=(const MetricsRegistry&) = delete;

  // Register HELP text and type for a family. Optional; undescribed families
  // take their type from the first operation applied to them.
  void describe(std::string name, std::string help, model::MetricKind kind);

  void set_gauge(std::string_view name, const model::Labels& labels, double value);
  // Negative deltas are ignored: counters only go up.
  void increment_counter(std::string_view name, const model::Labels& labels, double delta = 1.0);

  void apply(const model::MetricObservation& obs);
  void apply(const std::vector<model::MetricObservation>& observations);

  [[nodiscard]] std::optional<double> value(std::string_view name, const model::Labels& labels) const;

  // Ordered by name, then by sorted label set.
  [[nodiscard]] std::vector<model::MetricSample> snapshot() const;
  [[nodiscard]] std::vector<model::MetricFamily> families() const;
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] static model::Labels normalize(model::Labels labels);

private:
  struct Key {
    std::string name;
    model::Labels labels;
    auto operator<=>(const Key&) const = default;
  };
  struct Cell {
    model::MetricKind kind{model::MetricKind::Gauge};
    std::atomic<double> value{0.0};
  };

  Cell& cell(std::string_view name, const model::Labels& labels, model::MetricKind kind);

  mutable std::shared_mutex mu_;
  std::map<Key, std::unique_ptr<Cell>> cells_;
  std::map<std::string, model::MetricFamily, std::less<>> families_;
};

} // namespace rtspmon::app

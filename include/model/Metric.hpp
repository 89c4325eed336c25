#pragma once
#include <string>
#include <utility>
#include <vector>

namespace rtspmon::model {

enum class MetricKind { Gauge, Counter };
enum class MetricOp { SetGauge, IncrementCounter };

using Label = std::pair<std::string, std::string>;
using Labels = std::vector<Label>;

struct MetricObservation {
  std::string name;
  Labels labels;
  double value{};
  MetricOp op{MetricOp::SetGauge};
};

struct MetricSample {
  std::string name;
  Labels labels;   // sorted by key
  double value{};
  MetricKind kind{MetricKind::Gauge};
};

struct MetricFamily {
  std::string name;
  std::string help;
  MetricKind kind{MetricKind::Gauge};
};

[[nodiscard]] inline const char* metric_kind_name(MetricKind k) {
  return k == MetricKind::Counter ? "counter" : "gauge";
}

} // namespace rtspmon::model

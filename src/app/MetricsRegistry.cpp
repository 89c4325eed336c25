#include "app/MetricsRegistry.hpp"
#include <algorithm>
#include <mutex>

namespace rtspmon::app {

model::Labels MetricsRegistry::normalize(model::Labels labels) {
  std::stable_sort(labels.begin(), labels.end(),
                   [](const model::Label& a, const model::Label& b) { return a.first < b.first; });
  // Duplicate keys: the last one given wins.
  for (size_t i = 0; i + 1 < labels.size();) {
    if (labels[i].first == labels[i + 1].first) labels.erase(labels.begin() + static_cast<long>(i));
    else ++i;
  }
  return labels;
}

void MetricsRegistry::describe(std::string name, std::string help, model::MetricKind kind) {
  std::unique_lock lock(mu_);
  auto key = name;
  families_.insert_or_assign(std::move(key), model::MetricFamily{std::move(name), std::move(help), kind});
}

MetricsRegistry::Cell& MetricsRegistry::cell(std::string_view name, const model::Labels& labels,
                                             model::MetricKind kind) {
  Key key{std::string(name), normalize(labels)};
  {
    std::shared_lock lock(mu_);
    auto it = cells_.find(key);
    if (it != cells_.end()) return *it->second;
  }
  std::unique_lock lock(mu_);
  auto [it, inserted] = cells_.try_emplace(std::move(key), nullptr);
  if (inserted) {
    auto c = std::make_unique<Cell>();
    auto fam = families_.find(name);
    c->kind = fam != families_.end() ? fam->second.kind : kind;
    it->second = std::move(c);
  }
  return *it->second;
}

void MetricsRegistry::set_gauge(std::string_view name, const model::Labels& labels, double value) {
  cell(name, labels, model::MetricKind::Gauge).value.store(value, std::memory_order_release);
}

void MetricsRegistry::increment_counter(std::string_view name, const model::Labels& labels, double delta) {
  if (!(delta >= 0.0)) return;
  cell(name, labels, model::MetricKind::Counter).value.fetch_add(delta, std::memory_order_acq_rel);
}

void MetricsRegistry::apply(const model::MetricObservation& obs) {
  if (obs.op == model::MetricOp::IncrementCounter) increment_counter(obs.name, obs.labels, obs.value);
  else set_gauge(obs.name, obs.labels, obs.value);
}

void MetricsRegistry::apply(const std::vector<model::MetricObservation>& observations) {
  for (const auto& obs : observations) apply(obs);
}

std::optional<double> MetricsRegistry::value(std::string_view name, const model::Labels& labels) const {
  Key key{std::string(name), normalize(labels)};
  std::shared_lock lock(mu_);
  auto it = cells_.find(key);
  if (it == cells_.end()) return std::nullopt;
  return it->second->value.load(std::memory_order_acquire);
}

std::vector<model::MetricSample> MetricsRegistry::snapshot() const {
  std::vector<model::MetricSample> out;
  std::shared_lock lock(mu_);
  out.reserve(cells_.size());
  for (const auto& [key, c] : cells_) {
    out.push_back(model::MetricSample{key.name, key.labels,
                                      c->value.load(std::memory_order_acquire), c->kind});
  }
  return out;
}

std::vector<model::MetricFamily> MetricsRegistry::families() const {
  std::vector<model::MetricFamily> out;
  std::shared_lock lock(mu_);
  out.reserve(families_.size());
  for (const auto& [name, fam] : families_) out.push_back(fam);
  return out;
}

std::size_t MetricsRegistry::size() const {
  std::shared_lock lock(mu_);
  return cells_.size();
}

} // namespace rtspmon::app

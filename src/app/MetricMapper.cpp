#include "app/MetricMapper.hpp"
#include "probe/ErrorClassifier.hpp"
#include <string>

namespace rtspmon::app {

namespace {

using model::Labels;
using model::MetricKind;
using model::MetricObservation;
using model::MetricOp;

struct Emitter {
  const std::string& stream;
  std::vector<MetricObservation>& out;

  void gauge(std::string_view name, double v, Labels extra = {}) {
    Labels labels{{"stream", stream}};
    for (auto& l : extra) labels.push_back(std::move(l));
    out.push_back(MetricObservation{std::string(name), std::move(labels), v, MetricOp::SetGauge});
  }
  void inc(std::string_view name, Labels extra = {}) {
    Labels labels{{"stream", stream}};
    for (auto& l : extra) labels.push_back(std::move(l));
    out.push_back(MetricObservation{std::string(name), std::move(labels), 1.0, MetricOp::IncrementCounter});
  }
};

void map_codec(Emitter& e, std::string_view name, const std::optional<std::string>& now,
               const std::optional<std::string>* before) {
  if (!now) return;
  if (before && *before && **before != *now) e.gauge(name, 0.0, {{"codec", **before}});
  e.gauge(name, 1.0, {{"codec", *now}});
}

// Single-valued info series: the current value is 1, a replaced one drops to 0.
void map_info(Emitter& e, std::string_view name, const char* key, const std::string& now,
              const std::string* before) {
  if (before && *before != now) e.gauge(name, 0.0, {{key, *before}});
  e.gauge(name, 1.0, {{key, now}});
}

model::BitrateSource effective_source(const CycleReport& r) {
  const auto& d = r.result.description;
  if (d.bitrate_bps) return d.bitrate_source;
  if (r.sample.bps) return model::BitrateSource::Sample;
  return model::BitrateSource::None;
}

void map_success(Emitter& e, const CycleReport& r) {
  const auto& d = r.result.description;
  const auto* prev = r.previous;

  e.gauge(metric::stream_up, 1.0);

  // Width/height/frame rate only exist for video; absent values keep the last
  // known gauges rather than clearing them.
  if (d.frame_rate) e.gauge(metric::frame_rate, *d.frame_rate);
  if (d.width) e.gauge(metric::width, *d.width);
  if (d.height) e.gauge(metric::height, *d.height);

  std::optional<double> bitrate = d.bitrate_bps;
  if (!bitrate && r.sample.bps) bitrate = r.sample.bps;
  if (bitrate) e.gauge(metric::bitrate, *bitrate);

  std::string source = model::bitrate_source_label(effective_source(r));
  std::string before_source;
  if (prev) before_source = model::bitrate_source_label(prev->bitrate_bps ? prev->bitrate_source
                                                                          : model::BitrateSource::None);
  map_info(e, metric::bitrate_source, "source", source, prev ? &before_source : nullptr);

  map_codec(e, metric::video_codec, d.video_codec, prev ? &prev->video_codec : nullptr);
  map_codec(e, metric::audio_codec, d.audio_codec, prev ? &prev->audio_codec : nullptr);

  if (d.audio_sample_rate_hz) e.gauge(metric::audio_sample_rate, *d.audio_sample_rate_hz);
  if (d.audio_channels) e.gauge(metric::audio_channels, *d.audio_channels);

  e.gauge(metric::last_success, r.wall_time_seconds);
}

void map_failure(Emitter& e, const CycleReport& r) {
  e.gauge(metric::stream_up, 0.0);
  e.inc(metric::errors, {{"error", model::error_kind_label(r.result.failure.kind)}});
  map_info(e, metric::last_error, "reason", last_error_reason(r.result.failure), r.previous_error);
}

} // namespace

auto last_error_reason(const model::ProbeFailure& failure) -> std::string {
  return probe::short_reason(failure.message.empty() ? model::error_kind_label(failure.kind)
                                                     : failure.message);
}

auto map_cycle(const model::StreamTarget& target, const CycleReport& report)
    -> std::vector<model::MetricObservation> {
  std::vector<model::MetricObservation> out;
  if (report.result.cancelled()) return out;

  Emitter e{target.name, out};
  if (report.result.ok()) map_success(e, report);
  else map_failure(e, report);

  e.gauge(metric::consecutive_failures, report.consecutive_failures);
  if (report.result.ok()) e.gauge(metric::exit_code, 0.0);
  else if (report.result.failure.exit_code) e.gauge(metric::exit_code, *report.result.failure.exit_code);
  e.gauge(metric::duration, report.duration_seconds);
  e.inc(metric::cycles);

  if (report.sample.attempted) {
    e.gauge(metric::sample_seconds, report.sample.window_seconds);
    if (!report.sample.bps) e.inc(metric::sample_errors);
  }
  return out;
}

void register_catalog(MetricsRegistry& registry) {
  auto g = [&](std::string_view name, const char* help) {
    registry.describe(std::string(name), help, MetricKind::Gauge);
  };
  auto c = [&](std::string_view name, const char* help) {
    registry.describe(std::string(name), help, MetricKind::Counter);
  };
  g(metric::stream_up, "1 if the last probe of the stream succeeded, 0 otherwise");
  g(metric::frame_rate, "Video frame rate from the last successful probe (last known good)");
  g(metric::width, "Video width in pixels from the last successful probe (last known good)");
  g(metric::height, "Video height in pixels from the last successful probe (last known good)");
  g(metric::bitrate, "Stream bitrate in bits per second, from headers or sampling (last known good)");
  g(metric::video_codec, "Video codec presence: 1 for the current codec, 0 for a replaced one");
  g(metric::audio_codec, "Audio codec presence: 1 for the current codec, 0 for a replaced one");
  g(metric::bitrate_source, "Where the last bitrate came from (format, stream, sample or none): 1 current, 0 replaced");
  g(metric::last_error, "Short reason of the most recent probe failure: 1 current, 0 replaced");
  g(metric::audio_sample_rate, "Audio sample rate in Hz from the last successful probe (last known good)");
  g(metric::audio_channels, "Audio channel count from the last successful probe (last known good)");
  g(metric::last_success, "Unix time of the last successful probe");
  g(metric::consecutive_failures, "Number of failed probes since the last success");
  c(metric::errors, "Failed probes by error kind");
  g(metric::duration, "Wall time of the last probe cycle in seconds");
  c(metric::cycles, "Completed probe cycles");
  g(metric::exit_code, "Exit code of the last probe tool run (124 on timeout)");
  g(metric::sample_seconds, "Window length of the last bitrate sample attempt in seconds");
  c(metric::sample_errors, "Bitrate sample attempts that produced no value");
}

} // namespace rtspmon::app

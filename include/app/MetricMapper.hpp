#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "app/MetricsRegistry.hpp"
#include "model/Metric.hpp"
#include "model/Stream.hpp"

namespace rtspmon::app {

// Metric names are part of the exporter's external contract.
namespace metric {
inline constexpr std::string_view stream_up = "stream_up";
inline constexpr std::string_view frame_rate = "stream_frame_rate";
inline constexpr std::string_view width = "stream_resolution_width";
inline constexpr std::string_view height = "stream_resolution_height";
inline constexpr std::string_view bitrate = "stream_bitrate_bps";
inline constexpr std::string_view video_codec = "stream_video_codec_info";
inline constexpr std::string_view audio_codec = "stream_audio_codec_info";
inline constexpr std::string_view bitrate_source = "stream_bitrate_source_info";
inline constexpr std::string_view last_error = "stream_last_error_info";
inline constexpr std::string_view audio_sample_rate = "stream_audio_sample_rate_hz";
inline constexpr std::string_view audio_channels = "stream_audio_channels";
inline constexpr std::string_view last_success = "stream_last_success_timestamp_seconds";
inline constexpr std::string_view consecutive_failures = "stream_consecutive_failures";
inline constexpr std::string_view errors = "probe_errors_total";
inline constexpr std::string_view duration = "probe_duration_seconds";
inline constexpr std::string_view cycles = "probe_cycles_total";
inline constexpr std::string_view exit_code = "probe_exit_code";
inline constexpr std::string_view sample_seconds = "bitrate_last_sample_seconds";
inline constexpr std::string_view sample_errors = "bitrate_sample_errors_total";
} // namespace metric

// Everything one probe cycle hands to the mapper.
struct CycleReport {
  model::ProbeResult result;
  double duration_seconds{};
  double wall_time_seconds{};      // Unix time at cycle start
  int consecutive_failures{};      // streak after this cycle
  model::BitrateSample sample{};   // attempted == false when no sample was taken
  // Last successful description of this stream, used to retire codec series
  // that changed. Null before the first success.
  const model::StreamDescription* previous{nullptr};
  // Reason label of the last exported error, so a new reason retires it.
  // Null before the first failure.
  const std::string* previous_error{nullptr};
};

// Pure: same input, same observations, in a fixed order.
// Failure cycles leave media-property gauges at their last known values.
[[nodiscard]] auto map_cycle(const model::StreamTarget& target, const CycleReport& report)
    -> std::vector<model::MetricObservation>;

// Value of the "reason" label on stream_last_error_info for this failure.
[[nodiscard]] auto last_error_reason(const model::ProbeFailure& failure) -> std::string;

// HELP/TYPE for every family the mapper can emit.
void register_catalog(MetricsRegistry& registry);

} // namespace rtspmon::app

#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace rtspmon::model {

struct StreamTarget {
  std::string name;   // value of the "stream" label
  std::string url;
  std::chrono::milliseconds interval{30000};
};

enum class ErrorKind { Timeout, ProcessError, ParseError, ConnectionRefused, Unreachable, Unknown };

// Label value used for probe_errors_total{error="..."}
[[nodiscard]] auto error_kind_label(ErrorKind kind) -> const char*;

enum class BitrateSource { None, Format, Stream, Sample };

[[nodiscard]] auto bitrate_source_label(BitrateSource source) -> const char*;

// Media properties of one probe. Every field is independently optional.
struct StreamDescription {
  std::optional<std::string> video_codec;
  std::optional<std::string> audio_codec;
  std::optional<double> frame_rate;
  std::optional<int> width;
  std::optional<int> height;
  std::optional<double> bitrate_bps;
  BitrateSource bitrate_source{BitrateSource::None};
  std::optional<int> audio_sample_rate_hz;
  std::optional<int> audio_channels;
};

struct ProbeFailure {
  ErrorKind kind{ErrorKind::Unknown};
  std::string message;            // short single-line reason
  std::optional<int> exit_code;
};

struct ProbeResult {
  enum class Status { Success, Failure, Cancelled };

  Status status{Status::Failure};
  StreamDescription description;  // valid when status == Success
  ProbeFailure failure;           // valid when status == Failure

  [[nodiscard]] bool ok() const { return status == Status::Success; }
  [[nodiscard]] bool cancelled() const { return status == Status::Cancelled; }

  [[nodiscard]] static ProbeResult success(StreamDescription d);
  [[nodiscard]] static ProbeResult fail(ErrorKind kind, std::string message,
                                        std::optional<int> exit_code = std::nullopt);
  [[nodiscard]] static ProbeResult cancel();
};

// Outcome of one bitrate sampling attempt. A failed attempt leaves bps empty.
struct BitrateSample {
  bool attempted{false};
  std::optional<double> bps;
  double window_seconds{0.0};
  std::string method;             // method that produced bps, or the last one tried
  std::string error;
};

} // namespace rtspmon::model

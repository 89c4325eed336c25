#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "probe/IProbeInvoker.hpp"

namespace rtspmon::probe {

enum class SampleMethod { Auto, FfmpegPipe, FfprobePackets };

[[nodiscard]] auto parse_sample_method(std::string_view text) -> std::optional<SampleMethod>;
[[nodiscard]] auto sample_method_name(SampleMethod m) -> const char*;

inline constexpr int kMaxSampleSeconds = 30;

struct SamplerOptions {
  SampleMethod method{SampleMethod::Auto};
  std::string ffmpeg{"ffmpeg"};
  std::string ffprobe{"ffprobe"};
  std::string transport{"tcp"};
  int window_seconds{5};                     // clamped to [1, kMaxSampleSeconds]
  int64_t io_timeout_us{15000000};
  // Allowance on top of the window for connection setup and teardown.
  std::chrono::milliseconds slack{10000};
  std::chrono::milliseconds cancel_grace{5000};
};

class FfmpegBitrateSampler final : public IBitrateSampler {
public:
  explicit FfmpegBitrateSampler(SamplerOptions opts);

  [[nodiscard]] model::BitrateSample sample(const model::StreamTarget& target,
                                            std::stop_token st) override;

  [[nodiscard]] int window_seconds() const { return window_; }

  [[nodiscard]] auto pipe_command(const std::string& url) const -> std::vector<std::string>;
  [[nodiscard]] auto packets_command(const std::string& url) const -> std::vector<std::string>;

private:
  model::BitrateSample sample_pipe(const model::StreamTarget& target, std::stop_token st);
  model::BitrateSample sample_packets(const model::StreamTarget& target, std::stop_token st);

  SamplerOptions opts_;
  int window_;
};

} // namespace rtspmon::probe

#include "probe/BitrateSampler.hpp"
#include <algorithm>
#include <cstdio>
#include <utility>
#include "probe/ErrorClassifier.hpp"
#include "probe/FfprobeParser.hpp"
#include "util/Subprocess.hpp"

using namespace std::chrono;

namespace rtspmon::probe {

auto parse_sample_method(std::string_view text) -> std::optional<SampleMethod> {
  if (text == "auto") return SampleMethod::Auto;
  if (text == "ffmpeg_pipe") return SampleMethod::FfmpegPipe;
  if (text == "ffprobe_packets") return SampleMethod::FfprobePackets;
  return std::nullopt;
}

auto sample_method_name(SampleMethod m) -> const char* {
  switch (m) {
    case SampleMethod::FfmpegPipe:     return "ffmpeg_pipe";
    case SampleMethod::FfprobePackets: return "ffprobe_packets";
    case SampleMethod::Auto:           break;
  }
  return "auto";
}

FfmpegBitrateSampler::FfmpegBitrateSampler(SamplerOptions opts)
    : opts_(std::move(opts)), window_(std::clamp(opts_.window_seconds, 1, kMaxSampleSeconds)) {}

auto FfmpegBitrateSampler::pipe_command(const std::string& url) const -> std::vector<std::string> {
  // Remux without decoding; -t bounds the amount of media read.
  return {opts_.ffmpeg, "-nostdin", "-v", "error",
          "-rtsp_transport", opts_.transport,
          "-rw_timeout", std::to_string(opts_.io_timeout_us),
          "-i", url,
          "-t", std::to_string(window_),
          "-map", "0", "-c", "copy", "-f", "mpegts", "pipe:1"};
}

auto FfmpegBitrateSampler::packets_command(const std::string& url) const -> std::vector<std::string> {
  return {opts_.ffprobe, "-v", "error",
          "-rtsp_transport", opts_.transport,
          "-rw_timeout", std::to_string(opts_.io_timeout_us),
          "-show_packets",
          "-read_intervals", "%+" + std::to_string(window_),
          "-of", "json", url};
}

static std::string run_failure(const util::ProcessResult& run) {
  if (run.status == util::ProcessResult::Status::Completed)
    return "rc=" + std::to_string(run.exit_code) + " " + short_reason(run.err);
  if (run.status == util::ProcessResult::Status::Errored) return short_reason(run.error);
  return util::process_status_name(run.status);
}

model::BitrateSample FfmpegBitrateSampler::sample_pipe(const model::StreamTarget& target,
                                                       std::stop_token st) {
  model::BitrateSample s;
  s.attempted = true;
  s.window_seconds = window_;
  s.method = sample_method_name(SampleMethod::FfmpegPipe);

  util::ProcessOptions popts;
  popts.timeout = seconds(window_) + opts_.slack;
  popts.cancel_grace = opts_.cancel_grace;
  popts.count_stdout_only = true;
  auto run = util::run_process(pipe_command(target.url), popts, st);
  if (!run.succeeded()) {
    s.error = run_failure(run);
    return s;
  }
  if (run.stdout_bytes == 0) {
    s.error = "no bytes read";
    return s;
  }
  s.bps = static_cast<double>(run.stdout_bytes) * 8.0 / window_;
  return s;
}

model::BitrateSample FfmpegBitrateSampler::sample_packets(const model::StreamTarget& target,
                                                          std::stop_token st) {
  model::BitrateSample s;
  s.attempted = true;
  s.window_seconds = window_;
  s.method = sample_method_name(SampleMethod::FfprobePackets);

  util::ProcessOptions popts;
  popts.timeout = seconds(window_) + opts_.slack;
  popts.cancel_grace = opts_.cancel_grace;
  popts.max_capture = 32u * 1024u * 1024u;
  auto run = util::run_process(packets_command(target.url), popts, st);
  if (!run.succeeded()) {
    s.error = run_failure(run);
    return s;
  }
  std::string error;
  auto bytes = parse_packet_bytes(run.out, error);
  if (!bytes) {
    s.error = error;
    return s;
  }
  if (*bytes == 0) {
    s.error = "no packets read";
    return s;
  }
  s.bps = static_cast<double>(*bytes) * 8.0 / window_;
  return s;
}

model::BitrateSample FfmpegBitrateSampler::sample(const model::StreamTarget& target,
                                                  std::stop_token st) {
  model::BitrateSample s;
  switch (opts_.method) {
    case SampleMethod::FfmpegPipe:
      s = sample_pipe(target, st);
      break;
    case SampleMethod::FfprobePackets:
      s = sample_packets(target, st);
      break;
    case SampleMethod::Auto:
      s = sample_pipe(target, st);
      if (!s.bps && !st.stop_requested()) {
        std::fprintf(stderr, "rtspmon: bitrate: %s: ffmpeg_pipe failed (%s), trying ffprobe_packets\n",
                     target.name.c_str(), s.error.c_str());
        s = sample_packets(target, st);
      }
      break;
  }
  if (s.bps) {
    std::fprintf(stderr, "rtspmon: bitrate: %s: %s window=%ds -> %.0f bps\n",
                 target.name.c_str(), s.method.c_str(), window_, *s.bps);
  } else {
    std::fprintf(stderr, "rtspmon: bitrate: %s: %s sample failed: %s\n",
                 target.name.c_str(), s.method.c_str(), s.error.c_str());
  }
  return s;
}

} // namespace rtspmon::probe

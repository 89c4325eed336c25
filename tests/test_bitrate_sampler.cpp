#include "minitest.hpp"
#include "fixtures.hpp"
#include "probe/BitrateSampler.hpp"
#include <chrono>

using namespace std::chrono_literals;
using rtspmon::model::StreamTarget;
using rtspmon::probe::FfmpegBitrateSampler;
using rtspmon::probe::SampleMethod;
using rtspmon::probe::SamplerOptions;

static StreamTarget target() {
  return StreamTarget{"cam1", "rtsp://cam1.local/live", 1000ms};
}

TEST(sampler_window_is_capped) {
  SamplerOptions opts;
  opts.window_seconds = 300;
  ASSERT_EQ(FfmpegBitrateSampler(opts).window_seconds(), 30);
  opts.window_seconds = 0;
  ASSERT_EQ(FfmpegBitrateSampler(opts).window_seconds(), 1);
}

TEST(sampler_method_names) {
  ASSERT_TRUE(rtspmon::probe::parse_sample_method("ffmpeg_pipe") == SampleMethod::FfmpegPipe);
  ASSERT_TRUE(rtspmon::probe::parse_sample_method("ffprobe_packets") == SampleMethod::FfprobePackets);
  ASSERT_TRUE(rtspmon::probe::parse_sample_method("auto") == SampleMethod::Auto);
  ASSERT_FALSE(rtspmon::probe::parse_sample_method("magic").has_value());
}

TEST(sampler_pipe_command_bounds_window) {
  SamplerOptions opts;
  opts.window_seconds = 4;
  FfmpegBitrateSampler s(opts);
  auto cmd = s.pipe_command("rtsp://h/s");
  std::string joined;
  for (const auto& a : cmd) joined += a + " ";
  ASSERT_TRUE(joined.find("-t 4 ") != std::string::npos);
  ASSERT_TRUE(joined.find("-c copy -f mpegts pipe:1") != std::string::npos);
  auto pk = s.packets_command("rtsp://h/s");
  joined.clear();
  for (const auto& a : pk) joined += a + " ";
  ASSERT_TRUE(joined.find("-read_intervals %+4 ") != std::string::npos);
}

TEST(sampler_pipe_counts_bytes) {
  TempDir dir("sampler_pipe");
  // 2 s window, 500000 bytes -> 2,000,000 bps
  auto ffmpeg = dir.script("ffmpeg", "head -c 500000 /dev/zero\n");
  SamplerOptions opts;
  opts.method = SampleMethod::FfmpegPipe;
  opts.ffmpeg = ffmpeg;
  opts.window_seconds = 2;
  FfmpegBitrateSampler s(opts);
  auto r = s.sample(target(), {});
  ASSERT_TRUE(r.attempted);
  ASSERT_TRUE(r.bps.has_value());
  ASSERT_NEAR(*r.bps, 2000000.0, 0.5);
  ASSERT_EQ(r.method, std::string("ffmpeg_pipe"));
}

TEST(sampler_zero_bytes_is_no_value) {
  TempDir dir("sampler_zero");
  auto ffmpeg = dir.script("ffmpeg", "exit 0\n");
  SamplerOptions opts;
  opts.method = SampleMethod::FfmpegPipe;
  opts.ffmpeg = ffmpeg;
  auto r = FfmpegBitrateSampler(opts).sample(target(), {});
  ASSERT_TRUE(r.attempted);
  ASSERT_FALSE(r.bps.has_value());
  ASSERT_FALSE(r.error.empty());
}

TEST(sampler_auto_falls_back_to_packets) {
  TempDir dir("sampler_auto");
  auto ffmpeg = dir.script("ffmpeg", "echo 'Connection refused' 1>&2\nexit 1\n");
  auto json = dir.write("packets.json", R"({"packets":[{"size":"250000"},{"size":"250000"}]})");
  auto ffprobe = dir.script("ffprobe", "cat " + json + "\n");
  SamplerOptions opts;
  opts.method = SampleMethod::Auto;
  opts.ffmpeg = ffmpeg;
  opts.ffprobe = ffprobe;
  opts.window_seconds = 4;
  auto r = FfmpegBitrateSampler(opts).sample(target(), {});
  ASSERT_TRUE(r.bps.has_value());
  ASSERT_NEAR(*r.bps, 1000000.0, 0.5);
  ASSERT_EQ(r.method, std::string("ffprobe_packets"));
}

TEST(sampler_hung_tool_is_bounded) {
  TempDir dir("sampler_hung");
  auto ffmpeg = dir.script("ffmpeg", "exec sleep 30\n");
  SamplerOptions opts;
  opts.method = SampleMethod::FfmpegPipe;
  opts.ffmpeg = ffmpeg;
  opts.window_seconds = 1;
  opts.slack = 200ms;
  auto t0 = std::chrono::steady_clock::now();
  auto r = FfmpegBitrateSampler(opts).sample(target(), {});
  ASSERT_TRUE(std::chrono::steady_clock::now() - t0 < 5s);
  ASSERT_FALSE(r.bps.has_value());
  ASSERT_EQ(r.error, std::string("timed out"));
}

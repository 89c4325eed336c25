#include "app/Config.hpp"
#include "app/MetricMapper.hpp"
#include "app/MetricsRegistry.hpp"
#include "app/MetricsServer.hpp"
#include "app/Scheduler.hpp"
#include "probe/BitrateSampler.hpp"
#include "probe/FfprobeInvoker.hpp"
#include "util/Subprocess.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int){ g_stop.store(true); }

static void usage() {
  std::cout << "Usage: rtspmon [--config PATH] [--listen HOST:PORT] [--once] [-h|--help]\n";
  std::cout << "  --config PATH       TOML file (also RTSPMON_CONFIG)\n";
  std::cout << "  --listen HOST:PORT  metrics listen address (overrides LISTEN_ADDRESS)\n";
  std::cout << "  --once              probe every stream once, print metrics, exit 0 if all up\n";
  std::cout << "Streams come from RTSP_STREAMS (comma separated, name=url allowed).\n";
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::signal(SIGPIPE, SIG_IGN);

  std::string config_path;
  std::string listen_override;
  bool once = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--listen" && i + 1 < argc) listen_override = argv[++i];
    else if (a == "--once") once = true;
    else if (a == "-h" || a == "--help") { usage(); return 0; }
    else {
      std::fprintf(stderr, "rtspmon: unknown argument '%s'\n", a.c_str());
      usage();
      return 2;
    }
  }

  auto loaded = rtspmon::app::load_config(config_path);
  if (!loaded) return 2;
  auto cfg = std::move(*loaded);
  if (!listen_override.empty() &&
      !rtspmon::app::parse_listen_address(listen_override, cfg.listen_host, cfg.listen_port)) {
    std::fprintf(stderr, "rtspmon: config: invalid --listen '%s'\n", listen_override.c_str());
    return 2;
  }
  rtspmon::app::print_config_summary(cfg);

  if (rtspmon::util::find_executable(cfg.ffprobe).empty())
    std::fprintf(stderr, "rtspmon: warning: '%s' not found; every probe will fail\n", cfg.ffprobe.c_str());

  const auto grace = std::chrono::milliseconds(cfg.shutdown_grace_seconds * 1000LL);

  rtspmon::probe::ProbeOptions popts;
  popts.ffprobe = cfg.ffprobe;
  popts.transport = cfg.transport;
  popts.timeout = std::chrono::milliseconds(cfg.timeout_seconds * 1000LL);
  popts.io_timeout_us = cfg.io_timeout_us;
  popts.cancel_grace = grace;
  rtspmon::probe::FfprobeInvoker invoker(popts);

  std::unique_ptr<rtspmon::probe::FfmpegBitrateSampler> sampler;
  if (cfg.sample_seconds > 0) {
    rtspmon::probe::SamplerOptions sopts;
    sopts.method = rtspmon::probe::parse_sample_method(cfg.bitrate_method)
                       .value_or(rtspmon::probe::SampleMethod::Auto);
    sopts.ffmpeg = cfg.ffmpeg;
    sopts.ffprobe = cfg.ffprobe;
    sopts.transport = cfg.transport;
    sopts.window_seconds = cfg.sample_seconds;
    sopts.io_timeout_us = cfg.io_timeout_us;
    sopts.cancel_grace = grace;
    sampler = std::make_unique<rtspmon::probe::FfmpegBitrateSampler>(sopts);
  }

  rtspmon::app::MetricsRegistry registry;
  rtspmon::app::register_catalog(registry);

  rtspmon::app::SchedulerOptions sched_opts;
  sched_opts.sampling_enabled = sampler != nullptr;
  sched_opts.sample_every_n = cfg.sample_every_n;
  sched_opts.verbose = cfg.verbose;
  rtspmon::app::Scheduler scheduler(cfg.streams, invoker, sampler.get(), registry, sched_opts);

  if (once) {
    std::jthread watcher([&](std::stop_token st){
      while (!st.stop_requested()) {
        if (g_stop.load()) { scheduler.stop(); return; }
        std::this_thread::sleep_for(100ms);
      }
    });
    scheduler.run_once();
    watcher.request_stop();
    std::cout << rtspmon::app::registry_to_prometheus(registry) << std::flush;
    for (std::size_t i = 0; i < scheduler.size(); ++i)
      if (scheduler.last_up(i) != std::optional<bool>(true)) return 1;
    return 0;
  }

  rtspmon::app::ServerOptions server_opts;
  server_opts.host = cfg.listen_host;
  server_opts.port = cfg.listen_port;
  server_opts.path = cfg.metrics_path;
  rtspmon::app::MetricsServer server(registry, server_opts);
  if (!server.start()) {
    std::fprintf(stderr, "rtspmon: fatal: cannot serve metrics on %s:%u\n",
                 cfg.listen_host.c_str(), cfg.listen_port);
    return 2;
  }

  scheduler.start();
  while (!g_stop.load()) std::this_thread::sleep_for(100ms);

  std::fprintf(stderr, "rtspmon: shutting down (grace %ds)\n", cfg.shutdown_grace_seconds);
  scheduler.stop();
  server.stop();
  return 0;
}

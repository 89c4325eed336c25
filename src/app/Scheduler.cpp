#include "app/Scheduler.hpp"
#include "app/MetricMapper.hpp"
#include <chrono>
#include <cstdio>
#include <exception>
#include <utility>

using namespace std::chrono;

namespace rtspmon::app {

Scheduler::Scheduler(std::vector<model::StreamTarget> targets, probe::IProbeInvoker& invoker,
                     probe::IBitrateSampler* sampler, MetricsRegistry& registry, SchedulerOptions opts)
    : invoker_(invoker), sampler_(sampler), registry_(registry), opts_(opts) {
  if (opts_.sample_every_n < 1) opts_.sample_every_n = 1;
  workers_.reserve(targets.size());
  for (auto& t : targets) {
    auto w = std::make_unique<Worker>();
    w->target = std::move(t);
    workers_.push_back(std::move(w));
  }
}

Scheduler::~Scheduler() { stop(); }

void Scheduler::start() {
  if (started_) return;
  started_ = true;
  for (auto& w : workers_) {
    Worker* wp = w.get();
    w->thread = std::jthread([this, wp](std::stop_token st){ worker_loop(*wp, st); });
  }
}

void Scheduler::stop() {
  once_stop_.request_stop();
  for (auto& w : workers_)
    if (w->thread.joinable()) w->thread.request_stop();
  for (auto& w : workers_)
    if (w->thread.joinable()) w->thread.join();
}

std::optional<bool> Scheduler::last_up(std::size_t i) const {
  int v = workers_[i]->last_up.load();
  if (v < 0) return std::nullopt;
  return v == 1;
}

void Scheduler::run_once() {
  std::vector<std::jthread> threads;
  threads.reserve(workers_.size());
  auto token = once_stop_.get_token();
  for (auto& w : workers_) {
    Worker* wp = w.get();
    threads.emplace_back([this, wp, token]{ run_cycle(*wp, token); });
  }
  // jthread destructors join
}

void Scheduler::worker_loop(Worker& w, std::stop_token st) {
  const auto interval = w.target.interval;
  std::fprintf(stderr, "rtspmon: scheduler: %s: worker started (interval %lldms)\n",
               w.target.name.c_str(), static_cast<long long>(interval.count()));

  auto next = steady_clock::now();
  while (!st.stop_requested()) {
    run_cycle(w, st);
    if (st.stop_requested()) break;

    next += interval;
    auto now = steady_clock::now();
    if (now >= next) {
      // Overran: start again at once, drop the ticks that passed meanwhile.
      auto missed = static_cast<uint64_t>((now - next) / interval);
      if (missed > 0) {
        w.skipped.fetch_add(missed);
        std::fprintf(stderr, "rtspmon: scheduler: %s: warning: cycle overran interval, skipped %llu tick(s)\n",
                     w.target.name.c_str(), static_cast<unsigned long long>(missed));
      }
      next = now;
      continue;
    }

    std::unique_lock lock(w.mu);
    w.cv.wait_until(lock, st, next, []{ return false; });
  }
  std::fprintf(stderr, "rtspmon: scheduler: %s: worker stopped after %llu cycle(s)\n",
               w.target.name.c_str(), static_cast<unsigned long long>(w.cycles.load()));
}

model::ProbeResult Scheduler::probe_and_sample(Worker& w, std::stop_token st,
                                               model::BitrateSample& sample) {
  auto result = invoker_.probe(w.target, st);
  if (!result.ok()) return result;

  ++w.successes;
  const bool due = w.successes % static_cast<uint64_t>(opts_.sample_every_n) == 0;
  if (opts_.sampling_enabled && sampler_ && due && !result.description.bitrate_bps &&
      !st.stop_requested()) {
    sample = sampler_->sample(w.target, st);
    // A sample interrupted by shutdown is neither a value nor an error.
    if (st.stop_requested() && !sample.bps) sample = model::BitrateSample{};
    if (sample.bps) {
      result.description.bitrate_bps = sample.bps;
      result.description.bitrate_source = model::BitrateSource::Sample;
    }
  }
  return result;
}

void Scheduler::run_cycle(Worker& w, std::stop_token st) {
  bool expected = false;
  if (!w.in_flight.compare_exchange_strong(expected, true)) {
    w.skipped.fetch_add(1);
    std::fprintf(stderr, "rtspmon: scheduler: %s: warning: previous cycle still in flight, skipping tick\n",
                 w.target.name.c_str());
    return;
  }
  int active = w.active.fetch_add(1) + 1;
  int seen = w.max_overlap.load();
  while (active > seen && !w.max_overlap.compare_exchange_weak(seen, active)) {}

  const auto t0 = steady_clock::now();
  const double wall = duration<double>(system_clock::now().time_since_epoch()).count();

  CycleReport report;
  try {
    report.result = probe_and_sample(w, st, report.sample);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "rtspmon: scheduler: %s: cycle raised: %s\n", w.target.name.c_str(), e.what());
    report.result = model::ProbeResult::fail(model::ErrorKind::Unknown, e.what());
  } catch (...) {
    std::fprintf(stderr, "rtspmon: scheduler: %s: cycle raised a non-standard exception\n",
                 w.target.name.c_str());
    report.result = model::ProbeResult::fail(model::ErrorKind::Unknown, "non-standard exception");
  }
  report.duration_seconds = duration<double>(steady_clock::now() - t0).count();
  report.wall_time_seconds = wall;

  if (report.result.cancelled()) {
    // Shutdown is not a stream failure: nothing recorded.
    w.active.fetch_sub(1);
    w.in_flight.store(false);
    return;
  }

  if (report.result.ok()) w.streak = 0;
  else ++w.streak;
  report.consecutive_failures = w.streak;
  report.previous = w.last_good ? &*w.last_good : nullptr;
  report.previous_error = w.last_error ? &*w.last_error : nullptr;

  registry_.apply(map_cycle(w.target, report));

  if (report.result.ok()) {
    w.last_good = report.result.description;
    if (opts_.verbose) {
      const auto& d = report.result.description;
      std::fprintf(stderr, "rtspmon: probe: %s: up video=%s %dx%d fps=%.2f bitrate=%.0f(%s) in %.2fs\n",
                   w.target.name.c_str(), d.video_codec.value_or("-").c_str(),
                   d.width.value_or(0), d.height.value_or(0), d.frame_rate.value_or(0.0),
                   d.bitrate_bps.value_or(0.0), model::bitrate_source_label(d.bitrate_source),
                   report.duration_seconds);
    }
  } else {
    const auto& f = report.result.failure;
    w.last_error = last_error_reason(f);
    std::fprintf(stderr, "rtspmon: probe: %s: %s: %s (streak %d)\n", w.target.name.c_str(),
                 model::error_kind_label(f.kind), f.message.c_str(), w.streak);
  }

  w.last_up.store(report.result.ok() ? 1 : 0);
  w.cycles.fetch_add(1);
  w.active.fetch_sub(1);
  w.in_flight.store(false);
}

} // namespace rtspmon::app

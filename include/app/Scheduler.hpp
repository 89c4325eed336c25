#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "app/MetricsRegistry.hpp"
#include "model/Stream.hpp"
#include "probe/IProbeInvoker.hpp"

namespace rtspmon::app {

struct SchedulerOptions {
  bool sampling_enabled{false};
  int sample_every_n{4};       // sample on every Nth successful probe
  bool verbose{false};
};

// One worker thread per stream. Each worker runs probe -> (sample) -> map ->
// registry update in sequence, then waits for the next start-to-start tick.
// Workers share nothing but the registry.
//
// Shutdown grace for in-flight tool runs is enforced by the invoker and
// sampler (their cancel_grace); stop() requests stop and joins.
class Scheduler {
public:
  Scheduler(std::vector<model::StreamTarget> targets, probe::IProbeInvoker& invoker,
            probe::IBitrateSampler* sampler, MetricsRegistry& registry, SchedulerOptions opts);
  ~Scheduler();
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  void start();
  void stop();

  // One cycle for every stream, in parallel; returns when all are done.
  void run_once();

  [[nodiscard]] std::size_t size() const { return workers_.size(); }
  [[nodiscard]] const model::StreamTarget& target(std::size_t i) const { return workers_[i]->target; }
  [[nodiscard]] uint64_t cycles(std::size_t i) const { return workers_[i]->cycles.load(); }
  [[nodiscard]] uint64_t skipped_ticks(std::size_t i) const { return workers_[i]->skipped.load(); }
  [[nodiscard]] int max_overlap(std::size_t i) const { return workers_[i]->max_overlap.load(); }
  // Outcome of the most recent completed (not cancelled) cycle.
  [[nodiscard]] std::optional<bool> last_up(std::size_t i) const;

private:
  struct Worker {
    model::StreamTarget target;
    std::atomic<bool> in_flight{false};
    std::atomic<int> active{0};
    std::atomic<int> max_overlap{0};
    std::atomic<uint64_t> cycles{0};
    std::atomic<uint64_t> skipped{0};
    std::atomic<int> last_up{-1};
    // Touched only by the cycle that holds in_flight.
    int streak{0};
    uint64_t successes{0};
    std::optional<model::StreamDescription> last_good;
    std::optional<std::string> last_error;
    std::mutex mu;
    std::condition_variable_any cv;
    std::jthread thread;
  };

  void worker_loop(Worker& w, std::stop_token st);
  void run_cycle(Worker& w, std::stop_token st);
  model::ProbeResult probe_and_sample(Worker& w, std::stop_token st, model::BitrateSample& sample);

  probe::IProbeInvoker& invoker_;
  probe::IBitrateSampler* sampler_;
  MetricsRegistry& registry_;
  SchedulerOptions opts_;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::stop_source once_stop_;
  bool started_{false};
};

} // namespace rtspmon::app

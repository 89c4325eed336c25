#pragma once

#include <atomic>
#include <cstdint>
#include <list>
#include <string>
#include <thread>
#include <vector>
#include "app/MetricsRegistry.hpp"
#include "model/Metric.hpp"

namespace rtspmon::app {

// Serialize families and samples into Prometheus text exposition format
// (version 0.0.4). Samples must be ordered by name; families without samples
// are omitted, so an empty sample list yields an empty body.
[[nodiscard]] std::string to_prometheus(const std::vector<model::MetricFamily>& families,
                                        const std::vector<model::MetricSample>& samples);

[[nodiscard]] std::string registry_to_prometheus(const MetricsRegistry& registry);

struct ServerOptions {
  std::string host;              // empty: all interfaces
  uint16_t port{8001};           // 0: pick an ephemeral port
  std::string path{"/metrics"};
};

class MetricsServer {
public:
  MetricsServer(const MetricsRegistry& registry, ServerOptions opts);
  ~MetricsServer();
  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  // Binds and listens on the calling thread, then starts the event loop.
  // Returns false (after logging) when the socket cannot be set up.
  [[nodiscard]] bool start();
  void stop();

  // Bound port; differs from the requested one when that was 0.
  [[nodiscard]] uint16_t port() const { return bound_port_; }

private:
  // One accepted client, served on its own thread. The fd stays open until
  // the entry is pruned so that stop() can shut it down without racing reuse.
  struct Connection {
    int fd{-1};
    std::atomic<bool> done{false};
    std::jthread thread;
  };

  void run(std::stop_token st);
  void accept_client(int client_fd);
  void prune_connections(bool all);
  void handle_client(int client_fd);
  void close_fds();

  const MetricsRegistry& registry_;
  ServerOptions opts_;
  uint16_t bound_port_{0};
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::list<Connection> connections_;   // touched only by the loop thread
  std::jthread thread_;
};

} // namespace rtspmon::app

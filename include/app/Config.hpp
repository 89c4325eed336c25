#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "model/Stream.hpp"

namespace rtspmon::app {

struct Config {
  std::vector<model::StreamTarget> streams;
  int interval_seconds{30};
  int timeout_seconds{15};
  int64_t io_timeout_us{15000000};   // PROBE_TIMEOUT unless RTSP_STIMEOUT_US overrides
  std::string transport{"tcp"};
  std::string ffprobe{"ffprobe"};
  std::string ffmpeg{"ffmpeg"};
  int sample_seconds{0};             // 0 disables bitrate sampling
  int sample_every_n{4};
  std::string bitrate_method{"auto"};
  std::string listen_host;           // empty: all interfaces
  uint16_t listen_port{8001};
  std::string metrics_path{"/metrics"};
  int shutdown_grace_seconds{5};
  bool verbose{false};
  std::string config_path;           // TOML file actually read, if any
};

// Environment lookup that also accepts the lowercase spelling of the name.
const char* getenv_compat(const char* name);
bool env_flag(const char* name, bool defv);

// "a,b" or "name=url,..." into targets. Blank items are dropped.
[[nodiscard]] auto parse_stream_list(std::string_view text, std::chrono::milliseconds interval)
    -> std::vector<model::StreamTarget>;

// URL with any user:password@ part removed.
[[nodiscard]] auto derive_stream_name(std::string_view url) -> std::string;

// "host:port", ":port" or "port". False when the port is not 1..65535
// (0 is accepted so tests can ask for an ephemeral port).
[[nodiscard]] bool parse_listen_address(std::string_view text, std::string& host, uint16_t& port);

// Returns one message per problem; empty means valid.
[[nodiscard]] auto validate_config(const Config& cfg) -> std::vector<std::string>;

// Resolve TOML -> env -> compiled default, then validate. Diagnostics go to
// stderr; nullopt means startup must abort. An empty path falls back to
// RTSPMON_CONFIG; no file at all is fine.
[[nodiscard]] std::optional<Config> load_config(const std::string& path = {});

void print_config_summary(const Config& cfg);

} // namespace rtspmon::app

#include "app/Config.hpp"
#include "probe/BitrateSampler.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <set>

namespace rtspmon::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt(name);
  for (auto& c : alt) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (alt != name) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

static std::optional<int64_t> parse_int(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  if (s.empty()) return std::nullopt;
  int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

auto derive_stream_name(std::string_view url) -> std::string {
  auto scheme = url.find("://");
  size_t auth_start = scheme == std::string_view::npos ? 0 : scheme + 3;
  auto auth_end = url.find('/', auth_start);
  auto at = url.rfind('@', auth_end == std::string_view::npos ? url.size() : auth_end);
  if (at == std::string_view::npos || at < auth_start) return std::string(url);
  std::string out(url.substr(0, auth_start));
  out += url.substr(at + 1);
  return out;
}

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

auto parse_stream_list(std::string_view text, std::chrono::milliseconds interval)
    -> std::vector<model::StreamTarget> {
  std::vector<model::StreamTarget> out;
  while (!text.empty()) {
    auto comma = text.find(',');
    auto item = trim(text.substr(0, comma));
    if (!item.empty()) {
      model::StreamTarget t;
      t.interval = interval;
      // "name=url" only when '=' precedes the scheme; URLs may carry '=' in queries.
      auto eq = item.find('=');
      auto scheme = item.find("://");
      if (eq != std::string_view::npos && (scheme == std::string_view::npos || eq < scheme)) {
        t.name = std::string(trim(item.substr(0, eq)));
        t.url = std::string(trim(item.substr(eq + 1)));
      } else {
        t.url = std::string(item);
      }
      if (t.name.empty()) t.name = derive_stream_name(t.url);
      out.push_back(std::move(t));
    }
    if (comma == std::string_view::npos) break;
    text.remove_prefix(comma + 1);
  }
  return out;
}

bool parse_listen_address(std::string_view text, std::string& host, uint16_t& port) {
  text = trim(text);
  std::string_view h, p;
  if (auto colon = text.rfind(':'); colon != std::string_view::npos) {
    h = text.substr(0, colon);
    p = text.substr(colon + 1);
  } else {
    p = text;
  }
  auto n = parse_int(p);
  if (!n || *n < 0 || *n > 65535) return false;
  host = std::string(h);
  port = static_cast<uint16_t>(*n);
  return true;
}

auto validate_config(const Config& cfg) -> std::vector<std::string> {
  std::vector<std::string> errors;
  std::set<std::string> names;
  for (const auto& s : cfg.streams) {
    if (!s.url.starts_with("rtsp://") && !s.url.starts_with("rtsps://"))
      errors.push_back("stream '" + s.name + "': URL must start with rtsp:// or rtsps://");
    else if (s.url.size() <= (s.url.starts_with("rtsps://") ? 8u : 7u))
      errors.push_back("stream '" + s.name + "': URL has no host");
    if (!names.insert(s.name).second)
      errors.push_back("duplicate stream name '" + s.name + "'");
  }
  if (cfg.interval_seconds <= 0) errors.push_back("probe interval must be positive");
  if (cfg.timeout_seconds <= 0) errors.push_back("probe timeout must be positive");
  if (cfg.io_timeout_us <= 0) errors.push_back("RTSP_STIMEOUT_US must be positive");
  if (cfg.transport != "tcp" && cfg.transport != "udp")
    errors.push_back("transport must be tcp or udp, got '" + cfg.transport + "'");
  if (!probe::parse_sample_method(cfg.bitrate_method))
    errors.push_back("unknown bitrate method '" + cfg.bitrate_method + "'");
  if (cfg.sample_seconds < 0) errors.push_back("bitrate sample seconds must not be negative");
  if (cfg.sample_every_n <= 0) errors.push_back("bitrate sample cadence must be positive");
  if (cfg.shutdown_grace_seconds < 0) errors.push_back("shutdown grace must not be negative");
  if (cfg.metrics_path.empty() || cfg.metrics_path.front() != '/')
    errors.push_back("metrics path must start with '/'");
  return errors;
}

namespace {

// TOML -> env -> compiled default. Unparseable values are reported, not
// silently replaced by the default.
struct Resolver {
  const util::TomlReader& toml;
  bool have_toml;
  std::vector<std::string>& errors;

  std::string str(const char* section, const char* key, const char* env, const std::string& def) const {
    if (have_toml && section && toml.has(section, key)) return toml.get_string(section, key, def);
    if (env) {
      if (const char* v = getenv_compat(env)) return std::string(v);
    }
    return def;
  }

  int64_t num(const char* section, const char* key, const char* env, int64_t def) const {
    std::string text;
    std::string origin;
    if (have_toml && section && toml.has(section, key)) {
      text = toml.get_string(section, key);
      origin = std::string("[") + section + "] " + key;
    } else if (env) {
      if (const char* v = getenv_compat(env)) { text = v; origin = env; }
    }
    if (origin.empty()) return def;
    auto n = parse_int(text);
    if (!n) {
      errors.push_back(origin + ": not an integer: '" + text + "'");
      return def;
    }
    return *n;
  }

  // Same as num(), for settings held in an int: out-of-range values are errors.
  int num_int(const char* section, const char* key, const char* env, int def) const {
    int64_t n = num(section, key, env, def);
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
      errors.push_back(std::string(env ? env : key) + ": out of range: " + std::to_string(n));
      return def;
    }
    return static_cast<int>(n);
  }
};

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

} // namespace

std::optional<Config> load_config(const std::string& path) {
  Config cfg;
  std::vector<std::string> errors;

  std::string file = path;
  if (file.empty()) {
    if (const char* v = getenv_compat("RTSPMON_CONFIG")) file = v;
  }
  util::TomlReader toml;
  bool have_toml = false;
  if (!file.empty()) {
    if (!toml.load(file)) {
      std::fprintf(stderr, "rtspmon: config: cannot read '%s'\n", file.c_str());
      return std::nullopt;
    }
    have_toml = true;
    cfg.config_path = file;
  }

  Resolver r{toml, have_toml, errors};

  cfg.interval_seconds = r.num_int("probe", "interval_seconds", "PROBE_INTERVAL", cfg.interval_seconds);
  cfg.timeout_seconds = r.num_int("probe", "timeout_seconds", "PROBE_TIMEOUT", cfg.timeout_seconds);
  cfg.io_timeout_us = r.num(nullptr, nullptr, "RTSP_STIMEOUT_US",
                            static_cast<int64_t>(cfg.timeout_seconds) * 1000000);
  cfg.transport = lower(r.str("probe", "transport", "RTSP_TRANSPORT", cfg.transport));
  cfg.ffprobe = r.str("probe", "ffprobe", "FFPROBE_PATH", cfg.ffprobe);
  cfg.ffmpeg = r.str("bitrate", "ffmpeg", "FFMPEG_PATH", cfg.ffmpeg);
  cfg.shutdown_grace_seconds = r.num_int("probe", "shutdown_grace_seconds", "SHUTDOWN_GRACE_SECONDS", cfg.shutdown_grace_seconds);

  cfg.sample_seconds = r.num_int("bitrate", "sample_seconds", "BITRATE_SAMPLE_SECONDS", cfg.sample_seconds);
  if (cfg.sample_seconds > probe::kMaxSampleSeconds) {
    std::fprintf(stderr, "rtspmon: config: bitrate sample window %ds capped at %ds\n",
                 cfg.sample_seconds, probe::kMaxSampleSeconds);
    cfg.sample_seconds = probe::kMaxSampleSeconds;
  }
  cfg.sample_every_n = r.num_int("bitrate", "every_n", "BITRATE_SAMPLE_EVERY_N", cfg.sample_every_n);
  cfg.bitrate_method = lower(r.str("bitrate", "method", "BITRATE_METHOD", cfg.bitrate_method));

  std::string listen = r.str("server", "listen", "LISTEN_ADDRESS", ":8001");
  if (!parse_listen_address(listen, cfg.listen_host, cfg.listen_port))
    errors.push_back("invalid listen address '" + listen + "'");
  cfg.metrics_path = r.str("server", "path", "METRICS_PATH", cfg.metrics_path);
  cfg.verbose = have_toml && toml.has("log", "verbose") ? toml.get_bool("log", "verbose")
                                                        : env_flag("RTSPMON_VERBOSE", false);

  std::string streams = r.str("probe", "streams", "RTSP_STREAMS", "rtsp://mediamtx:8554/obs/mystream");
  cfg.streams = parse_stream_list(streams, std::chrono::seconds(std::max(cfg.interval_seconds, 1)));

  for (auto& e : validate_config(cfg)) errors.push_back(std::move(e));
  if (!errors.empty()) {
    for (const auto& e : errors) std::fprintf(stderr, "rtspmon: config: %s\n", e.c_str());
    return std::nullopt;
  }
  if (cfg.streams.empty())
    std::fprintf(stderr, "rtspmon: config: warning: no streams configured; serving an empty registry\n");
  return cfg;
}

void print_config_summary(const Config& cfg) {
  std::fprintf(stderr, "rtspmon: config: %s\n",
               cfg.config_path.empty() ? "(environment only)" : cfg.config_path.c_str());
  std::fprintf(stderr, "rtspmon: config: %zu stream(s), interval=%ds timeout=%ds io_timeout=%lldus transport=%s\n",
               cfg.streams.size(), cfg.interval_seconds, cfg.timeout_seconds,
               static_cast<long long>(cfg.io_timeout_us), cfg.transport.c_str());
  for (const auto& s : cfg.streams)
    std::fprintf(stderr, "rtspmon: config:   %s\n", s.name.c_str());
  if (cfg.sample_seconds > 0)
    std::fprintf(stderr, "rtspmon: config: bitrate sampling %ds every %d successes via %s\n",
                 cfg.sample_seconds, cfg.sample_every_n, cfg.bitrate_method.c_str());
  else
    std::fprintf(stderr, "rtspmon: config: bitrate sampling disabled\n");
  std::fprintf(stderr, "rtspmon: config: listen %s:%u%s, shutdown grace %ds\n",
               cfg.listen_host.c_str(), cfg.listen_port, cfg.metrics_path.c_str(),
               cfg.shutdown_grace_seconds);
}

} // namespace rtspmon::app

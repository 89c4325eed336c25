#include "probe/FfprobeParser.hpp"
#include <charconv>
#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rtspmon::probe {

namespace {

std::optional<double> parse_double(std::string_view sv) {
  while (!sv.empty() && sv.front() == ' ') sv.remove_prefix(1);
  while (!sv.empty() && sv.back() == ' ') sv.remove_suffix(1);
  if (sv.empty() || sv == "N/A") return std::nullopt;
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(v)) return std::nullopt;
  return v;
}

// ffprobe prints most numeric fields as strings ("bit_rate": "2000000") and a
// few as numbers ("width": 1920); accept both.
std::optional<double> number_field(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  if (it->is_number()) {
    double v = it->get<double>();
    return std::isfinite(v) ? std::optional<double>(v) : std::nullopt;
  }
  if (it->is_string()) return parse_double(it->get_ref<const std::string&>());
  return std::nullopt;
}

std::optional<int> positive_int_field(const json& obj, const char* key) {
  auto v = number_field(obj, key);
  if (!v || *v < 1.0 || *v > static_cast<double>(std::numeric_limits<int>::max())) return std::nullopt;
  return static_cast<int>(*v);
}

std::optional<std::string> string_field(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return std::nullopt;
  const auto& s = it->get_ref<const std::string&>();
  if (s.empty() || s == "N/A") return std::nullopt;
  return s;
}

std::optional<double> rational_field(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  if (it->is_string()) return parse_rational(it->get_ref<const std::string&>());
  if (it->is_number()) {
    double v = it->get<double>();
    if (std::isfinite(v) && v >= 0.0) return v;
  }
  return std::nullopt;
}

} // anonymous namespace

auto parse_rational(std::string_view text) -> std::optional<double> {
  auto slash = text.find('/');
  if (slash == std::string_view::npos) {
    auto v = parse_double(text);
    if (!v || *v < 0.0) return std::nullopt;
    return v;
  }
  auto num = parse_double(text.substr(0, slash));
  auto den = parse_double(text.substr(slash + 1));
  if (!num || !den || *den == 0.0) return std::nullopt;
  double v = *num / *den;
  if (!std::isfinite(v) || v < 0.0) return std::nullopt;
  return v;
}

auto parse_probe_output(std::string_view text, std::string& error)
    -> std::optional<model::StreamDescription> {
  if (text.find_first_not_of(" \t\r\n") == std::string_view::npos) {
    error = "empty output";
    return std::nullopt;
  }
  json doc = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object()) {
    error = "output is not a JSON object";
    return std::nullopt;
  }
  auto streams = doc.find("streams");
  if (streams == doc.end() || !streams->is_array()) {
    error = "missing streams array";
    return std::nullopt;
  }

  model::StreamDescription d;
  bool have_video = false, have_audio = false;
  double stream_bitrate_sum = 0.0;

  for (const auto& s : *streams) {
    if (!s.is_object()) continue;
    if (auto br = number_field(s, "bit_rate"); br && *br > 0.0) stream_bitrate_sum += *br;

    auto type = string_field(s, "codec_type");
    if (!type) continue;
    if (*type == "video" && !have_video) {
      have_video = true;
      d.video_codec = string_field(s, "codec_name").value_or("unknown");
      d.width = positive_int_field(s, "width");
      d.height = positive_int_field(s, "height");
      auto fr = rational_field(s, "avg_frame_rate");
      if (!fr || *fr == 0.0) {
        if (auto rfr = rational_field(s, "r_frame_rate")) fr = rfr;
      }
      d.frame_rate = fr;
    } else if (*type == "audio" && !have_audio) {
      have_audio = true;
      d.audio_codec = string_field(s, "codec_name").value_or("unknown");
      d.audio_sample_rate_hz = positive_int_field(s, "sample_rate");
      d.audio_channels = positive_int_field(s, "channels");
    }
  }

  if (!have_video && !have_audio) {
    error = streams->empty() ? "no stream entries" : "no video or audio stream entries";
    return std::nullopt;
  }

  if (auto fmt = doc.find("format"); fmt != doc.end() && fmt->is_object()) {
    if (auto br = number_field(*fmt, "bit_rate"); br && *br > 0.0) {
      d.bitrate_bps = *br;
      d.bitrate_source = model::BitrateSource::Format;
    }
  }
  if (!d.bitrate_bps && stream_bitrate_sum > 0.0) {
    d.bitrate_bps = stream_bitrate_sum;
    d.bitrate_source = model::BitrateSource::Stream;
  }

  return d;
}

auto parse_packet_bytes(std::string_view text, std::string& error) -> std::optional<uint64_t> {
  json doc = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object()) {
    error = "output is not a JSON object";
    return std::nullopt;
  }
  auto packets = doc.find("packets");
  if (packets == doc.end() || !packets->is_array()) {
    error = "missing packets array";
    return std::nullopt;
  }
  // A single packet above this is not a real packet; it would also make the
  // integer conversion below undefined.
  constexpr double kMaxPacketBytes = 64.0 * 1024 * 1024;
  uint64_t total = 0;
  for (const auto& p : *packets) {
    if (!p.is_object()) continue;
    auto size = number_field(p, "size");
    if (!size || !(*size > 0.0) || *size > kMaxPacketBytes) continue;
    total += static_cast<uint64_t>(*size);
  }
  return total;
}

} // namespace rtspmon::probe

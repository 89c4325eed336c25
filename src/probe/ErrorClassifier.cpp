#include "probe/ErrorClassifier.hpp"
#include <algorithm>
#include <cctype>

namespace rtspmon::probe {

namespace {

std::string ascii_lower(std::string_view sv) {
  std::string out(sv);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

// ffmpeg prefixes errors with the input URL ("rtsp://host/path: reason"). The
// URL is caller data and must not take part in matching.
std::string without_url_prefixes(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  while (!text.empty()) {
    auto nl = text.find('\n');
    std::string_view line = text.substr(0, nl);
    if (auto scheme = line.find("://"); scheme != std::string_view::npos) {
      auto colon = line.find(": ", scheme + 3);
      if (colon != std::string_view::npos && line.substr(0, scheme).find_first_of(" \t") == std::string_view::npos)
        line.remove_prefix(colon + 2);
    }
    out += line;
    out += '\n';
    if (nl == std::string_view::npos) break;
    text.remove_prefix(nl + 1);
  }
  return out;
}

} // anonymous namespace

auto classify_tool_error(std::string_view stderr_text) -> std::optional<model::ErrorKind> {
  const std::string s = ascii_lower(without_url_prefixes(stderr_text));
  if (s.contains("connection refused")) return model::ErrorKind::ConnectionRefused;
  if (s.contains("name or service not known") || s.contains("no such host") ||
      s.contains("temporary failure in name resolution") || s.contains("no route to host") ||
      s.contains("network is unreachable") || s.contains("host is unreachable"))
    return model::ErrorKind::Unreachable;
  if (s.contains("timed out")) return model::ErrorKind::Timeout;
  return std::nullopt;
}

bool is_unsupported_option(std::string_view stderr_text) {
  const std::string s = ascii_lower(stderr_text);
  return s.contains("unrecognized option") || s.contains("option not found");
}

auto short_reason(std::string_view text, std::size_t max_len) -> std::string {
  std::string out;
  out.reserve(std::min(text.size(), max_len));
  bool pending_space = false;
  for (char c : text) {
    if (c == '\n' || c == '\r' || c == '\t' || c == ' ') {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      if (out.size() + 1 >= max_len) break;
      out += ' ';
      pending_space = false;
    }
    if (out.size() >= max_len) break;
    out += c;
  }
  return out.empty() ? std::string("unknown") : out;
}

} // namespace rtspmon::probe

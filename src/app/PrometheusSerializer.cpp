#include "app/MetricsServer.hpp"
#include <charconv>
#include <cmath>
#include <map>
#include <string_view>

namespace {

void append_double(std::string& out, double v) {
  if (std::isnan(v)) { out += "NaN"; return; }
  if (std::isinf(v)) { out += v > 0 ? "+Inf" : "-Inf"; return; }
  // Whole numbers print without exponent or fraction.
  if (std::fabs(v) < 9.007199254740992e15 && v == std::trunc(v)) {
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), static_cast<int64_t>(v));
    out.append(buf, ptr);
    return;
  }
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

// HELP text escapes only backslash and newline.
void append_help(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

void emit_header(std::string& out, std::string_view name, std::string_view help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  append_help(out, help);  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_sample(std::string& out, const rtspmon::model::MetricSample& s) {
  out += s.name;
  if (!s.labels.empty()) {
    out += '{';
    bool first = true;
    for (const auto& [k, v] : s.labels) {
      if (!first) out += ',';
      first = false;
      out += k;  out += "=\"";  append_escaped(out, v);  out += '"';
    }
    out += '}';
  }
  out += ' ';
  append_double(out, s.value);
  out += '\n';
}

} // anonymous namespace

namespace rtspmon::app {

std::string to_prometheus(const std::vector<model::MetricFamily>& families,
                          const std::vector<model::MetricSample>& samples) {
  std::map<std::string_view, const model::MetricFamily*> by_name;
  for (const auto& f : families) by_name[f.name] = &f;

  std::string out;
  out.reserve(samples.size() * 64);
  std::string_view current;
  for (const auto& s : samples) {
    if (s.name != current) {
      current = s.name;
      auto it = by_name.find(current);
      if (it != by_name.end()) {
        emit_header(out, current, it->second->help, model::metric_kind_name(it->second->kind));
      } else {
        emit_header(out, current, current, model::metric_kind_name(s.kind));
      }
    }
    emit_sample(out, s);
  }
  return out;
}

std::string registry_to_prometheus(const MetricsRegistry& registry) {
  return to_prometheus(registry.families(), registry.snapshot());
}

} // namespace rtspmon::app

#include "model/Stream.hpp"
#include <utility>

namespace rtspmon::model {

auto error_kind_label(ErrorKind kind) -> const char* {
  switch (kind) {
    case ErrorKind::Timeout:           return "timeout";
    case ErrorKind::ProcessError:      return "process_error";
    case ErrorKind::ParseError:        return "parse_error";
    case ErrorKind::ConnectionRefused: return "connection_refused";
    case ErrorKind::Unreachable:       return "unreachable";
    case ErrorKind::Unknown:           break;
  }
  return "unknown";
}

auto bitrate_source_label(BitrateSource source) -> const char* {
  switch (source) {
    case BitrateSource::Format: return "format";
    case BitrateSource::Stream: return "stream";
    case BitrateSource::Sample: return "sample";
    case BitrateSource::None:   break;
  }
  return "none";
}

ProbeResult ProbeResult::success(StreamDescription d) {
  ProbeResult r;
  r.status = Status::Success;
  r.description = std::move(d);
  return r;
}

ProbeResult ProbeResult::fail(ErrorKind kind, std::string message, std::optional<int> exit_code) {
  ProbeResult r;
  r.status = Status::Failure;
  r.failure.kind = kind;
  r.failure.message = std::move(message);
  r.failure.exit_code = exit_code;
  return r;
}

ProbeResult ProbeResult::cancel() {
  ProbeResult r;
  r.status = Status::Cancelled;
  return r;
}

} // namespace rtspmon::model

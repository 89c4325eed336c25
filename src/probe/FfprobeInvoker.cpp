#include "probe/FfprobeInvoker.hpp"
#include <cstdio>
#include <utility>
#include "probe/ErrorClassifier.hpp"
#include "probe/FfprobeParser.hpp"

using namespace std::chrono;

namespace rtspmon::probe {

// Exit status reported for runs we had to kill, as timeout(1) does.
static constexpr int kTimeoutExitCode = 124;

FfprobeInvoker::FfprobeInvoker(ProbeOptions opts) : opts_(std::move(opts)) {}

auto FfprobeInvoker::build_command(const std::string& url, bool with_rw_timeout) const
    -> std::vector<std::string> {
  std::vector<std::string> cmd{opts_.ffprobe, "-v", "error", "-rtsp_transport", opts_.transport};
  if (with_rw_timeout) {
    cmd.emplace_back("-rw_timeout");
    cmd.emplace_back(std::to_string(opts_.io_timeout_us));
  }
  cmd.emplace_back("-show_streams");
  cmd.emplace_back("-show_format");
  cmd.emplace_back("-of");
  cmd.emplace_back("json");
  cmd.push_back(url);
  return cmd;
}

model::ProbeResult FfprobeInvoker::probe(const model::StreamTarget& target, std::stop_token st) {
  const auto deadline = steady_clock::now() + opts_.timeout;
  util::ProcessOptions popts;
  popts.timeout = opts_.timeout;
  popts.cancel_grace = opts_.cancel_grace;

  auto run = util::run_process(build_command(target.url, true), popts, st);

  // Older builds reject -rw_timeout; retry once without it inside the same budget.
  if (run.status == util::ProcessResult::Status::Completed && run.exit_code != 0 &&
      is_unsupported_option(run.err)) {
    auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
    if (remaining > milliseconds(0)) {
      std::fprintf(stderr, "rtspmon: probe: %s: ffprobe rejected -rw_timeout, retrying without it\n",
                   target.name.c_str());
      popts.timeout = remaining;
      run = util::run_process(build_command(target.url, false), popts, st);
    } else {
      return model::ProbeResult::fail(model::ErrorKind::Timeout, "probe budget exhausted before retry",
                                      kTimeoutExitCode);
    }
  }
  return to_probe_result(run, opts_.timeout);
}

auto to_probe_result(const util::ProcessResult& run, milliseconds timeout) -> model::ProbeResult {
  using Status = util::ProcessResult::Status;
  switch (run.status) {
    case Status::Cancelled:
      return model::ProbeResult::cancel();
    case Status::TimedOut:
      return model::ProbeResult::fail(model::ErrorKind::Timeout,
                                      "ffprobe did not finish within " +
                                          std::to_string(timeout.count()) + "ms",
                                      kTimeoutExitCode);
    case Status::Errored:
      return model::ProbeResult::fail(model::ErrorKind::ProcessError, short_reason(run.error));
    case Status::Completed:
      break;
  }

  if (run.exit_code != 0) {
    auto kind = classify_tool_error(run.err).value_or(model::ErrorKind::ProcessError);
    return model::ProbeResult::fail(kind, short_reason(run.err), run.exit_code);
  }

  std::string error;
  auto desc = parse_probe_output(run.out, error);
  if (!desc) return model::ProbeResult::fail(model::ErrorKind::ParseError, error, run.exit_code);
  return model::ProbeResult::success(std::move(*desc));
}

} // namespace rtspmon::probe

#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stop_token>
#include <string>
#include <vector>
#include <sys/types.h>

namespace rtspmon::util {

struct ProcessOptions {
  // Hard bound on the child's lifetime, measured from spawn.
  std::chrono::milliseconds timeout{15000};
  // Time the child may keep running after a stop request before it is killed.
  std::chrono::milliseconds cancel_grace{0};
  // Time between SIGTERM and SIGKILL once the child is being stopped.
  std::chrono::milliseconds term_grace{500};
  // Count stdout bytes without keeping them (ProcessResult::out stays empty).
  bool count_stdout_only{false};
  // Captured stdout/stderr beyond this many bytes are drained and dropped.
  std::size_t max_capture{4u * 1024u * 1024u};
};

struct ProcessResult {
  enum class Status { Completed, TimedOut, Cancelled, Errored };

  Status status{Status::Errored};
  int exit_code{-1};          // Completed only; 128+N when killed by signal N
  std::string out;
  std::string err;
  uint64_t stdout_bytes{};
  std::string error;          // Errored only
  pid_t pid{-1};
  std::chrono::duration<double> elapsed{};

  [[nodiscard]] bool succeeded() const { return status == Status::Completed && exit_code == 0; }
};

[[nodiscard]] auto process_status_name(ProcessResult::Status s) -> const char*;

// Search PATH for an executable. Names containing '/' are checked as given.
// Returns an empty string when nothing executable is found.
[[nodiscard]] auto find_executable(const std::string& name) -> std::string;

// Spawn argv[0] (PATH lookup) in its own process group and wait for it.
// On timeout, or once the cancel grace after a stop request expires, the
// whole group gets SIGTERM, then SIGKILL after term_grace. The child is
// always reaped before this returns.
[[nodiscard]] auto run_process(const std::vector<std::string>& argv,
                               const ProcessOptions& opts,
                               std::stop_token st = {}) -> ProcessResult;

} // namespace rtspmon::util

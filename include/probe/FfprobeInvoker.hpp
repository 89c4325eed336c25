#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "probe/IProbeInvoker.hpp"
#include "util/Subprocess.hpp"

namespace rtspmon::probe {

struct ProbeOptions {
  std::string ffprobe{"ffprobe"};
  std::string transport{"tcp"};                  // -rtsp_transport
  std::chrono::milliseconds timeout{15000};      // hard bound on one invocation (retry included)
  int64_t io_timeout_us{15000000};               // -rw_timeout passed to the tool
  std::chrono::milliseconds cancel_grace{5000};
};

class FfprobeInvoker final : public IProbeInvoker {
public:
  explicit FfprobeInvoker(ProbeOptions opts);

  [[nodiscard]] model::ProbeResult probe(const model::StreamTarget& target,
                                         std::stop_token st) override;

  [[nodiscard]] auto build_command(const std::string& url, bool with_rw_timeout) const
      -> std::vector<std::string>;

private:
  ProbeOptions opts_;
};

// Turn a finished tool run into a ProbeResult (classification + parsing).
[[nodiscard]] auto to_probe_result(const util::ProcessResult& run,
                                   std::chrono::milliseconds timeout) -> model::ProbeResult;

} // namespace rtspmon::probe

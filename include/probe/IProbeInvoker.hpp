#pragma once
#include <stop_token>
#include "model/Stream.hpp"

namespace rtspmon::probe {

// Inspects one stream. Implementations must return within their configured
// timeout and must honor stop requests (returning a Cancelled result).
class IProbeInvoker {
public:
  virtual ~IProbeInvoker() = default;

  [[nodiscard]] virtual model::ProbeResult probe(const model::StreamTarget& target,
                                                 std::stop_token st) = 0;
};

// Estimates realized bitrate by reading the stream for a bounded window.
// Failures are reported in the sample, never thrown.
class IBitrateSampler {
public:
  virtual ~IBitrateSampler() = default;

  [[nodiscard]] virtual model::BitrateSample sample(const model::StreamTarget& target,
                                                    std::stop_token st) = 0;
};

} // namespace rtspmon::probe

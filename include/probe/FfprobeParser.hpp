#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "model/Stream.hpp"

namespace rtspmon::probe {

// Parse `ffprobe -show_streams -show_format -of json` output.
// Returns nullopt (and sets error) when the text is not JSON or holds no
// video/audio stream entry. Missing optional fields stay unset.
[[nodiscard]] auto parse_probe_output(std::string_view json, std::string& error)
    -> std::optional<model::StreamDescription>;

// Sum of packets[].size from `ffprobe -show_packets -of json` output.
[[nodiscard]] auto parse_packet_bytes(std::string_view json, std::string& error)
    -> std::optional<uint64_t>;

// "30000/1001" -> 29.97..., "25" -> 25. Zero denominators and negative
// values yield nullopt.
[[nodiscard]] auto parse_rational(std::string_view text) -> std::optional<double>;

} // namespace rtspmon::probe

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include "model/Stream.hpp"

namespace rtspmon::probe {

// Best-effort mapping of tool stderr to an ErrorKind. Returns nullopt when
// the text carries no recognizable cause (callers fall back to ProcessError).
[[nodiscard]] auto classify_tool_error(std::string_view stderr_text) -> std::optional<model::ErrorKind>;

// True when stderr says an option is not supported by this tool build.
[[nodiscard]] bool is_unsupported_option(std::string_view stderr_text);

// Single line, at most max_len characters; "unknown" for empty input.
[[nodiscard]] auto short_reason(std::string_view text, std::size_t max_len = 120) -> std::string;

} // namespace rtspmon::probe

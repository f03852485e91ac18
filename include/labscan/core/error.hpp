#pragma once

#include <string_view>

namespace labscan::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  InvalidPage,
  PreprocessFailed,  // image operation raised (allocation, degenerate size)
  DecodeFailed,
  RecognitionFailed,
  Timeout,
  TransportError,
  HttpStatus,         // non-2xx reply from a remote endpoint
  MalformedResponse,  // reply body was not the expected JSON shape
  Cancelled,
  InvalidConfig,
};

/// Stable lowercase name for logs and CLI output.
[[nodiscard]] std::string_view to_string(PipelineError error) noexcept;

}  // namespace labscan::core

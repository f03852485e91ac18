#include <labscan/core/error.hpp>

namespace labscan::core {

std::string_view to_string(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::None:
      return "none";
    case PipelineError::InvalidPage:
      return "invalid_page";
    case PipelineError::PreprocessFailed:
      return "preprocess_failed";
    case PipelineError::DecodeFailed:
      return "decode_failed";
    case PipelineError::RecognitionFailed:
      return "recognition_failed";
    case PipelineError::Timeout:
      return "timeout";
    case PipelineError::TransportError:
      return "transport_error";
    case PipelineError::HttpStatus:
      return "http_status";
    case PipelineError::MalformedResponse:
      return "malformed_response";
    case PipelineError::Cancelled:
      return "cancelled";
    case PipelineError::InvalidConfig:
      return "invalid_config";
  }
  return "unknown";
}

}  // namespace labscan::core

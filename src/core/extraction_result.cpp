#include <labscan/core/extraction_result.hpp>

namespace labscan::core {

std::string_view to_string(ExtractionSource source) noexcept {
  switch (source) {
    case ExtractionSource::StructuredParser:
      return "structured_parser";
    case ExtractionSource::PatternFallback:
      return "pattern_fallback";
    case ExtractionSource::VisionFallback:
      return "vision_fallback";
    case ExtractionSource::Empty:
      return "empty";
  }
  return "unknown";
}

}  // namespace labscan::core

#pragma once

#include <labscan/core/error.hpp>
#include <labscan/core/page.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace labscan::vision {

/// Assumed text layout handed to the recognition engine.
enum class LayoutMode : std::uint8_t {
  AutoSegment,   // fully automatic page segmentation
  SingleBlock,   // one uniform block of text
  SingleColumn,  // one column of variable-size text
};

/// Order in which the grid search tries layouts.
inline constexpr std::array<LayoutMode, 3> kLayoutModes{
    LayoutMode::AutoSegment,
    LayoutMode::SingleBlock,
    LayoutMode::SingleColumn,
};

[[nodiscard]] std::string_view to_string(LayoutMode mode) noexcept;

/// Abstract OCR engine: Page + layout -> UTF-8 text.
/// Synchronous, local, deterministic for identical input.
class IRecognitionEngine {
 public:
  virtual ~IRecognitionEngine() = default;

  [[nodiscard]] virtual std::expected<std::string, labscan::core::PipelineError>
  recognize(const labscan::core::Page& page, LayoutMode mode) = 0;
};

}  // namespace labscan::vision

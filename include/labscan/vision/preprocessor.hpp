#pragma once

#include <labscan/core/error.hpp>
#include <labscan/core/page.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <string_view>
#include <vector>

namespace labscan::vision {

/// Enhancement recipe, each tuned for a capture condition.
enum class PreprocessStrategy : std::uint8_t {
  Standard,      // clean scans, PDF exports
  HighContrast,  // faded or low-contrast originals
  Photo,         // handheld photos: uneven light, sensor noise
};

inline constexpr std::array<PreprocessStrategy, 3> kPreprocessStrategies{
    PreprocessStrategy::Standard,
    PreprocessStrategy::HighContrast,
    PreprocessStrategy::Photo,
};

[[nodiscard]] std::string_view to_string(PreprocessStrategy strategy) noexcept;

struct PreprocessConfig {
  std::uint32_t min_dimension{1500};  // smaller side is upscaled to at least this
  std::uint32_t max_dimension{4000};  // larger side is downscaled to at most this
  std::uint8_t binarize_threshold{128};
};

struct PageDimensions {
  std::uint32_t width{0};
  std::uint32_t height{0};
};

/// Size after the floor/ceiling rules, aspect ratio preserved (truncating).
[[nodiscard]] PageDimensions bounded_dimensions(std::uint32_t width,
                                                std::uint32_t height,
                                                const PreprocessConfig& config);

/// A preprocessed copy of a page tagged with the strategy that produced it.
struct PreprocessedVariant {
  PreprocessStrategy strategy{PreprocessStrategy::Standard};
  labscan::core::Page image;
};

/// Grayscale -> bounded resize -> strategy enhancement -> binarization.
/// Output is always Grayscale8 containing only 0 and 255.
class Preprocessor {
 public:
  explicit Preprocessor(PreprocessConfig config = {});

  [[nodiscard]] std::expected<labscan::core::Page, labscan::core::PipelineError>
  apply(const labscan::core::Page& page, PreprocessStrategy strategy) const;

  /// All three strategies; a strategy that fails is left out.
  [[nodiscard]] std::vector<PreprocessedVariant> apply_all(
      const labscan::core::Page& page) const;

  [[nodiscard]] const PreprocessConfig& config() const noexcept { return config_; }

 private:
  PreprocessConfig config_;
};

}  // namespace labscan::vision

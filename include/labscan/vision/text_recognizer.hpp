#pragma once

#include <labscan/core/page.hpp>
#include <labscan/vision/preprocessor.hpp>
#include <labscan/vision/recognition_engine.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labscan::vision {

/// Code points + 2 x ASCII digits. Lab reports are numerically dense, so
/// digit-heavy text ranks above longer prose.
[[nodiscard]] std::size_t score_text(std::string_view text) noexcept;

/// One (strategy, layout) attempt of the grid search.
struct RecognitionCandidate {
  PreprocessStrategy strategy{PreprocessStrategy::Standard};
  LayoutMode mode{LayoutMode::AutoSegment};
  std::string text;  // trimmed
  std::size_t score{0};
  bool preprocessed{true};  // false only for the last-resort raw attempt
};

struct RecognitionOutcome {
  std::optional<RecognitionCandidate> best;
  std::vector<RecognitionCandidate> attempts;  // every attempt that returned text
  std::size_t failures{0};                     // attempts that errored

  [[nodiscard]] std::string text() const { return best ? best->text : std::string(); }
  [[nodiscard]] std::size_t score() const noexcept { return best ? best->score : 0; }
};

/// Exhaustive (strategy x layout) search keeping the highest-scoring text.
/// A failure in one combination is logged and skipped. If nothing usable comes
/// back, one last attempt runs on the unprocessed page.
class GridSearchRecognizer {
 public:
  GridSearchRecognizer(std::shared_ptr<IRecognitionEngine> engine,
                       Preprocessor preprocessor);

  [[nodiscard]] RecognitionOutcome recognize(const labscan::core::Page& page) const;

 private:
  std::shared_ptr<IRecognitionEngine> engine_;
  Preprocessor preprocessor_;
};

}  // namespace labscan::vision

#pragma once

#include <labscan/vision/recognition_engine.hpp>
#include <atomic>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace labscan::vision {

/// Engine that returns configurable text (for tests/demo).
/// Replies can be set per layout mode and per input kind: a binarized
/// (preprocessed) page vs. the raw page used for the last-resort attempt.
class MockRecognitionEngine : public IRecognitionEngine {
 public:
  /// Text returned for every call without a more specific reply.
  void set_text(std::string text);

  /// Text returned for one layout mode on preprocessed pages.
  void set_text_for_mode(LayoutMode mode, std::string text);

  /// Text returned for non-grayscale input (the unprocessed last-resort page).
  void set_raw_page_text(std::string text);

  /// Make calls with this layout mode fail with RecognitionFailed.
  void fail_mode(LayoutMode mode);

  /// Make every call fail.
  void fail_all(bool fail) noexcept { fail_all_ = fail; }

  [[nodiscard]] std::size_t call_count() const noexcept { return calls_.load(); }

  [[nodiscard]] std::expected<std::string, labscan::core::PipelineError>
  recognize(const labscan::core::Page& page, LayoutMode mode) override;

 private:
  mutable std::mutex mutex_;
  std::string default_text_;
  std::map<LayoutMode, std::string> mode_text_;
  std::map<LayoutMode, bool> failing_modes_;
  std::string raw_page_text_;
  bool has_raw_page_text_{false};
  std::atomic<bool> fail_all_{false};
  std::atomic<std::size_t> calls_{0};
};

}  // namespace labscan::vision

#pragma once

#include <labscan/core/alias_table.hpp>
#include <labscan/core/biomarker.hpp>
#include <labscan/core/error.hpp>
#include <labscan/core/page.hpp>
#include <labscan/llm/chat_client.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace labscan::extract {

struct VisionExtractorConfig {
  std::string model{"llava:7b"};
  std::chrono::milliseconds timeout{std::chrono::seconds(120)};
  double temperature{0.1};
};

struct VisionOutcome {
  std::vector<labscan::core::Biomarker> markers;
  std::optional<std::string> raw_text;  // text the model read, or its prose reply
  double confidence{0.0};
};

/// Last-resort extraction: the page image itself goes to a vision-capable model.
///
/// Reply handling:
///   JSON with markers     -> reported confidence (default 0.5), clamped
///   JSON without markers  -> confidence 0.0
///   prose (no JSON)       -> no markers, prose kept as raw_text, confidence 0.3
/// Transport errors and unparsable JSON are returned as errors.
class VisionExtractor {
 public:
  /// aliases must outlive the extractor.
  VisionExtractor(std::shared_ptr<labscan::llm::IChatClient> client,
                  const labscan::core::AliasTable& aliases,
                  VisionExtractorConfig config = {});

  [[nodiscard]] static std::string_view system_prompt() noexcept;

  [[nodiscard]] std::expected<VisionOutcome, labscan::core::PipelineError> extract(
      const labscan::core::Page& page, std::stop_token stop = {}) const;

  [[nodiscard]] const VisionExtractorConfig& config() const noexcept { return config_; }

 private:
  std::shared_ptr<labscan::llm::IChatClient> client_;
  const labscan::core::AliasTable* aliases_;
  VisionExtractorConfig config_;
};

}  // namespace labscan::extract

#pragma once

#include <labscan/core/alias_table.hpp>
#include <labscan/core/biomarker.hpp>
#include <labscan/core/error.hpp>
#include <labscan/llm/chat_client.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace labscan::extract {

struct StructuredParserConfig {
  std::string model{"llama3"};
  std::chrono::milliseconds timeout{std::chrono::seconds(90)};
  double temperature{0.1};
};

struct ParseOutcome {
  std::vector<labscan::core::Biomarker> markers;
  double confidence{0.0};  // clamped to [0, 1]
};

/// Recognized text -> typed markers via a text-only chat model.
/// The reply must carry {"markers": [...], "confidence": x}. A missing
/// confidence becomes 0.8 when markers were found, 0.0 otherwise.
class StructuredParser {
 public:
  /// aliases must outlive the parser.
  StructuredParser(std::shared_ptr<labscan::llm::IChatClient> client,
                   const labscan::core::AliasTable& aliases,
                   StructuredParserConfig config = {});

  [[nodiscard]] static std::string_view system_prompt() noexcept;
  [[nodiscard]] static std::string build_user_message(std::string_view raw_text);

  /// No length floor here; the pipeline stage decides whether text is worth sending.
  [[nodiscard]] std::expected<ParseOutcome, labscan::core::PipelineError> parse(
      std::string_view raw_text, std::stop_token stop = {}) const;

  [[nodiscard]] const StructuredParserConfig& config() const noexcept { return config_; }

 private:
  std::shared_ptr<labscan::llm::IChatClient> client_;
  const labscan::core::AliasTable* aliases_;
  StructuredParserConfig config_;
};

}  // namespace labscan::extract

#include <labscan/extract/vision_extractor.hpp>
#include <labscan/core/base64.hpp>
#include <labscan/extract/marker_reply.hpp>
#include <labscan/vision/document_decoder.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace labscan::extract {

namespace lc = labscan::core;

namespace {

constexpr std::string_view kSystemPrompt =
    R"PROMPT(You are an expert at reading lab reports and bloodwork panels.
Extract ALL biomarkers visible in this image.

For each biomarker provide:
- name: The biomarker name
- value: The numeric value
- unit: The unit of measurement
- reference_low: Lower bound of normal range (null if not shown)
- reference_high: Upper bound of normal range (null if not shown)
- flag: "H" if high, "L" if low, null otherwise

Return ONLY valid JSON: {"markers": [...], "raw_text": "all visible text", "confidence": 0.0-1.0})PROMPT";

constexpr std::string_view kUserText =
    "Extract all biomarkers from this lab report image. Return as JSON.";

constexpr double kDefaultConfidence = 0.5;
constexpr double kProseConfidence = 0.3;

}  // namespace

VisionExtractor::VisionExtractor(std::shared_ptr<labscan::llm::IChatClient> client,
                                 const lc::AliasTable& aliases,
                                 VisionExtractorConfig config)
    : client_(std::move(client)), aliases_(&aliases), config_(std::move(config)) {
  if (!client_) {
    throw std::invalid_argument("VisionExtractor: chat client is null");
  }
}

std::string_view VisionExtractor::system_prompt() noexcept { return kSystemPrompt; }

std::expected<VisionOutcome, lc::PipelineError> VisionExtractor::extract(
    const lc::Page& page, std::stop_token stop) const {
  auto png = labscan::vision::encode_png(page);
  if (!png) {
    return std::unexpected(png.error());
  }

  labscan::llm::ChatRequest request;
  request.model = config_.model;
  request.system_prompt = std::string(kSystemPrompt);
  request.user_text = std::string(kUserText);
  request.image = labscan::llm::ImageAttachment{"image/png", lc::base64_encode(*png)};
  request.temperature = config_.temperature;
  request.timeout = config_.timeout;
  request.stop = std::move(stop);

  const auto completion = client_->complete(request);
  if (!completion) {
    return std::unexpected(completion.error());
  }

  VisionOutcome outcome;
  if (!find_json_object(completion->content)) {
    spdlog::info("page {}: vision model replied without JSON", page.index());
    if (!completion->content.empty()) outcome.raw_text = completion->content;
    outcome.confidence = kProseConfidence;
    return outcome;
  }

  auto reply = parse_marker_reply(completion->content, *aliases_);
  if (!reply) {
    return std::unexpected(reply.error());
  }
  outcome.markers = std::move(reply->markers);
  outcome.raw_text = std::move(reply->raw_text);
  // A marker-less reply scores 0 whatever confidence it states.
  outcome.confidence = outcome.markers.empty()
                           ? 0.0
                           : std::clamp(reply->confidence.value_or(kDefaultConfidence), 0.0, 1.0);
  spdlog::info("page {}: vision model returned {} markers", page.index(), outcome.markers.size());
  return outcome;
}

}  // namespace labscan::extract

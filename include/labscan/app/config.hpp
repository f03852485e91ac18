#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace labscan::app {

/// Collaborator set: mock (scripted OCR and chat, no network) or remote
/// (Tesseract + an OpenAI-compatible chat endpoint).
enum class BackendType {
  Mock,
  Remote,
};

/// Pipeline configuration: endpoints, models, thresholds, limits.
struct PipelineConfig {
  BackendType backend{BackendType::Mock};

  // Chat-completion endpoint and models
  std::string llm_base_url{"http://localhost:11434/v1"};
  std::string llm_api_key;
  std::string text_model{"llama3"};
  std::string vision_model{"llava:7b"};
  double temperature{0.1};
  std::uint32_t structured_timeout_s{90};
  std::uint32_t vision_timeout_s{120};
  std::size_t min_text_chars{50};
  bool use_vision_fallback{true};

  // Recognition
  std::string ocr_language{"eng"};
  std::string tessdata_path;
  std::uint32_t min_dimension{1500};
  std::uint32_t max_dimension{4000};
  std::uint8_t binarize_threshold{128};
  double render_scale{2.0};

  // Execution
  std::size_t page_workers{1};  // 0 = hardware concurrency
  std::string log_level{"info"};

  // Upload limits
  std::size_t max_upload_bytes{50u * 1024u * 1024u};
  std::size_t max_files_per_batch{20};
};

/// Load config from a simple key=value file (one per line, '#' comments) on top
/// of the defaults. A missing file yields the defaults; malformed values are
/// skipped with a warning.
PipelineConfig load_config(const std::string& path);

/// Default config when no file is provided.
PipelineConfig default_config();

/// Overlay LABSCAN_LLM_BASE_URL, LABSCAN_LLM_API_KEY, LABSCAN_TEXT_MODEL,
/// LABSCAN_VISION_MODEL and LABSCAN_LOG_LEVEL when set and non-empty.
void apply_env_overrides(PipelineConfig& config);

}  // namespace labscan::app

#include <labscan/app/config.hpp>
#include <labscan/core/alias_table.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <string_view>

namespace labscan::app {

namespace {

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key = labscan::core::trim_copy(line.substr(0, pos));
  value = labscan::core::trim_copy(line.substr(pos + 1));
  return !key.empty();
}

template <typename T>
std::optional<T> parse_number(std::string_view text) {
  T out{};
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
  return out;
}

std::optional<bool> parse_bool(std::string_view text) {
  const std::string v = labscan::core::to_lower(text);
  if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
  if (v == "false" || v == "0" || v == "no" || v == "off") return false;
  return std::nullopt;
}

/// Assign when the value parses, otherwise warn and keep the current value.
template <typename T>
void set_number(T& field, std::string_view key, std::string_view value) {
  if (const auto parsed = parse_number<T>(value)) {
    field = *parsed;
  } else {
    spdlog::warn("config: ignoring malformed value for '{}': '{}'", key, value);
  }
}

void set_env(std::string& field, const char* name) {
  const char* value = std::getenv(name);
  if (value != nullptr && *value != '\0') field = value;
}

}  // namespace

PipelineConfig default_config() {
  return PipelineConfig{};
}

PipelineConfig load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    spdlog::warn("config: cannot open '{}', using defaults", path);
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    line = labscan::core::trim_copy(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "backend") {
      if (value == "remote") c.backend = BackendType::Remote;
      else if (value == "mock") c.backend = BackendType::Mock;
      else spdlog::warn("config: unknown backend '{}'", value);
    }
    else if (key == "llm_base_url") c.llm_base_url = value;
    else if (key == "llm_api_key") c.llm_api_key = value;
    else if (key == "text_model") c.text_model = value;
    else if (key == "vision_model") c.vision_model = value;
    else if (key == "temperature") set_number(c.temperature, key, value);
    else if (key == "structured_timeout_s") set_number(c.structured_timeout_s, key, value);
    else if (key == "vision_timeout_s") set_number(c.vision_timeout_s, key, value);
    else if (key == "min_text_chars") set_number(c.min_text_chars, key, value);
    else if (key == "use_vision_fallback") {
      if (const auto b = parse_bool(value)) c.use_vision_fallback = *b;
      else spdlog::warn("config: ignoring malformed value for '{}': '{}'", key, value);
    }
    else if (key == "ocr_language") c.ocr_language = value;
    else if (key == "tessdata_path") c.tessdata_path = value;
    else if (key == "min_dimension") set_number(c.min_dimension, key, value);
    else if (key == "max_dimension") set_number(c.max_dimension, key, value);
    else if (key == "binarize_threshold") {
      std::uint32_t threshold = c.binarize_threshold;
      set_number(threshold, key, value);
      if (threshold <= std::numeric_limits<std::uint8_t>::max()) {
        c.binarize_threshold = static_cast<std::uint8_t>(threshold);
      } else {
        spdlog::warn("config: binarize_threshold {} out of range", threshold);
      }
    }
    else if (key == "render_scale") set_number(c.render_scale, key, value);
    else if (key == "page_workers") set_number(c.page_workers, key, value);
    else if (key == "log_level") c.log_level = value;
    else if (key == "max_upload_bytes") set_number(c.max_upload_bytes, key, value);
    else if (key == "max_files_per_batch") set_number(c.max_files_per_batch, key, value);
    else spdlog::debug("config: unknown key '{}'", key);
  }
  return c;
}

void apply_env_overrides(PipelineConfig& config) {
  set_env(config.llm_base_url, "LABSCAN_LLM_BASE_URL");
  set_env(config.llm_api_key, "LABSCAN_LLM_API_KEY");
  set_env(config.text_model, "LABSCAN_TEXT_MODEL");
  set_env(config.vision_model, "LABSCAN_VISION_MODEL");
  set_env(config.log_level, "LABSCAN_LOG_LEVEL");
}

}  // namespace labscan::app

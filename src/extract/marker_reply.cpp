#include <labscan/extract/marker_reply.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <cmath>

namespace labscan::extract {

namespace lc = labscan::core;
using json = nlohmann::json;

std::optional<std::string_view> find_json_object(std::string_view text) noexcept {
  const auto start = text.find('{');
  if (start == std::string_view::npos) return std::nullopt;

  int depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = start; i < text.size(); ++i) {
    const char c = text[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '{') {
      ++depth;
    } else if (c == '}') {
      if (--depth == 0) return text.substr(start, i - start + 1);
    }
  }
  return std::nullopt;
}

std::optional<double> parse_decimal(std::string_view text) noexcept {
  if (text.empty()) return std::nullopt;
  double value = 0.0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || !std::isfinite(value)) return std::nullopt;
  return value;
}

std::optional<double> coerce_number(const json& value) {
  if (value.is_number()) {
    const double v = value.get<double>();
    if (!std::isfinite(v)) return std::nullopt;
    return v;
  }
  if (!value.is_string()) return std::nullopt;

  std::string digits;
  for (const char c : value.get_ref<const std::string&>()) {
    if ((c >= '0' && c <= '9') || c == '.' || c == '-') digits.push_back(c);
  }
  return parse_decimal(digits);
}

std::vector<lc::Biomarker> markers_from_json(const json& markers, const lc::AliasTable& aliases) {
  std::vector<lc::Biomarker> out;
  if (!markers.is_array()) return out;

  for (const auto& entry : markers) {
    if (!entry.is_object()) continue;

    const auto name_it = entry.find("name");
    if (name_it == entry.end() || !name_it->is_string()) continue;
    std::string name = aliases.normalize(name_it->get_ref<const std::string&>());
    if (name.empty()) continue;

    const auto value_it = entry.find("value");
    const auto value = value_it != entry.end() ? coerce_number(*value_it) : std::nullopt;
    if (!value) {
      spdlog::debug("dropping marker '{}': value not numeric", name);
      continue;
    }

    lc::Biomarker marker;
    marker.name = std::move(name);
    marker.value = *value;
    if (const auto unit = entry.find("unit"); unit != entry.end() && unit->is_string()) {
      marker.unit = lc::trim_copy(unit->get_ref<const std::string&>());
    }
    if (const auto low = entry.find("reference_low"); low != entry.end()) {
      marker.reference_low = coerce_number(*low);
    }
    if (const auto high = entry.find("reference_high"); high != entry.end()) {
      marker.reference_high = coerce_number(*high);
    }
    if (const auto flag = entry.find("flag"); flag != entry.end() && flag->is_string()) {
      marker.flag = lc::parse_flag(flag->get_ref<const std::string&>());
    }
    out.push_back(std::move(marker));
  }
  return out;
}

std::expected<MarkerReply, lc::PipelineError> parse_marker_reply(std::string_view content,
                                                                 const lc::AliasTable& aliases) {
  const auto object = find_json_object(content);
  if (!object) {
    spdlog::warn("no JSON object in model reply: {:.200}", content);
    return std::unexpected(lc::PipelineError::MalformedResponse);
  }

  const json doc = json::parse(*object, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object()) {
    spdlog::warn("model reply is not valid JSON");
    return std::unexpected(lc::PipelineError::MalformedResponse);
  }

  MarkerReply reply;
  if (const auto markers = doc.find("markers"); markers != doc.end()) {
    reply.markers = markers_from_json(*markers, aliases);
  }
  if (const auto confidence = doc.find("confidence");
      confidence != doc.end() && confidence->is_number()) {
    const double c = confidence->get<double>();
    if (std::isfinite(c)) reply.confidence = c;
  }
  if (const auto raw = doc.find("raw_text"); raw != doc.end() && raw->is_string()) {
    reply.raw_text = raw->get<std::string>();
  }
  return reply;
}

}  // namespace labscan::extract

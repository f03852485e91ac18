#pragma once

#include <labscan/core/alias_table.hpp>
#include <labscan/core/biomarker.hpp>
#include <labscan/core/error.hpp>
#include <nlohmann/json_fwd.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labscan::extract {

/// First balanced {...} in text, skipping braces inside JSON strings.
/// Models often wrap the object in prose or code fences.
[[nodiscard]] std::optional<std::string_view> find_json_object(std::string_view text) noexcept;

/// Parse a decimal number, whole input only. Accepts "5", "5.", "-0.25".
[[nodiscard]] std::optional<double> parse_decimal(std::string_view text) noexcept;

/// JSON number, or a string reduced to [0-9.-] first ("5.4 %" -> 5.4).
/// nullopt for anything else or a non-finite result.
[[nodiscard]] std::optional<double> coerce_number(const nlohmann::json& value);

/// Typed markers from a model's "markers" array. Names are normalized through
/// aliases; entries without a name or a coercible value are dropped.
[[nodiscard]] std::vector<labscan::core::Biomarker> markers_from_json(
    const nlohmann::json& markers, const labscan::core::AliasTable& aliases);

/// Decoded {"markers": [...], "confidence": x, "raw_text": "..."} reply.
/// confidence / raw_text are nullopt when absent or of the wrong type.
struct MarkerReply {
  std::vector<labscan::core::Biomarker> markers;
  std::optional<double> confidence;
  std::optional<std::string> raw_text;
};

/// MalformedResponse when content holds no JSON object or the object does not parse.
[[nodiscard]] std::expected<MarkerReply, labscan::core::PipelineError> parse_marker_reply(
    std::string_view content, const labscan::core::AliasTable& aliases);

}  // namespace labscan::extract

#pragma once

#include <labscan/app/upload_policy.hpp>
#include <labscan/core/biomarker.hpp>
#include <labscan/core/extraction_result.hpp>
#include <nlohmann/json.hpp>

namespace labscan::core {

/// {"name", "value", "unit", "reference_low", "reference_high", "flag"}; absent optionals are null.
void to_json(nlohmann::json& j, const Biomarker& marker);

/// {"markers", "raw_text", "confidence", "page_count"}.
void to_json(nlohmann::json& j, const ExtractionResult& result);

}  // namespace labscan::core

namespace labscan::app {

void to_json(nlohmann::json& j, const FileReport& file);
void to_json(nlohmann::json& j, const BulkReport& report);

}  // namespace labscan::app

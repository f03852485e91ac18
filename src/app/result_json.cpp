#include <labscan/app/result_json.hpp>

namespace labscan::core {

void to_json(nlohmann::json& j, const Biomarker& marker) {
  j = nlohmann::json{
      {"name", marker.name},
      {"value", marker.value},
      {"unit", marker.unit},
      {"reference_low", nullptr},
      {"reference_high", nullptr},
      {"flag", nullptr},
  };
  if (marker.reference_low) j["reference_low"] = *marker.reference_low;
  if (marker.reference_high) j["reference_high"] = *marker.reference_high;
  if (marker.flag) j["flag"] = std::string(flag_code(*marker.flag));
}

void to_json(nlohmann::json& j, const ExtractionResult& result) {
  j = nlohmann::json{
      {"markers", result.markers},
      {"raw_text", nullptr},
      {"confidence", result.confidence},
      {"page_count", result.page_count},
  };
  if (result.raw_text) j["raw_text"] = *result.raw_text;
}

}  // namespace labscan::core

namespace labscan::app {

void to_json(nlohmann::json& j, const FileReport& file) {
  j = nlohmann::json{
      {"filename", file.filename},
      {"success", file.success},
      {"markers", nlohmann::json::array()},
      {"raw_text", nullptr},
      {"confidence", nullptr},
      {"error", nullptr},
  };
  if (file.result) {
    j["markers"] = file.result->markers;
    if (file.result->raw_text) j["raw_text"] = *file.result->raw_text;
    j["confidence"] = file.result->confidence;
  }
  if (file.error) j["error"] = *file.error;
}

void to_json(nlohmann::json& j, const BulkReport& report) {
  j = nlohmann::json{
      {"total_files", report.total_files},
      {"successful", report.successful},
      {"failed", report.failed},
      {"total_markers", report.total_markers},
      {"results", report.results},
  };
}

}  // namespace labscan::app

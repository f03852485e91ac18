#include <labscan/app/upload_policy.hpp>
#include <labscan/core/alias_table.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>

namespace labscan::app {

namespace lc = labscan::core;

namespace {

constexpr std::array<std::string_view, 7> kAllowedTypes = {
    "application/pdf", "image/png",  "image/jpeg", "image/jpg",
    "image/gif",       "image/webp", "image/tiff",
};

constexpr std::array<std::string_view, 7> kAllowedExtensions = {
    ".pdf", ".png", ".jpg", ".jpeg", ".gif", ".webp", ".tiff",
};

constexpr std::string_view kNoMarkersMessage =
    "No markers could be extracted. The image may be unclear or not contain lab results.";

bool allowed_type(const lc::Document& document) {
  const std::string type = lc::to_lower(lc::trim_copy(document.content_type));
  if (std::find(kAllowedTypes.begin(), kAllowedTypes.end(), type) != kAllowedTypes.end()) {
    return true;
  }
  const std::string name = lc::to_lower(document.filename);
  return std::any_of(kAllowedExtensions.begin(), kAllowedExtensions.end(),
                     [&](std::string_view ext) { return name.ends_with(ext); });
}

std::string rejection_message(UploadRejection rejection, const lc::Document& document,
                              const PipelineConfig& config) {
  switch (rejection) {
    case UploadRejection::UnsupportedType:
      return "Unsupported file type: " + document.content_type;
    case UploadRejection::TooLarge:
      return "File too large (max " + std::to_string(config.max_upload_bytes / (1024 * 1024)) +
             "MB)";
    default:
      return std::string(to_string(rejection));
  }
}

}  // namespace

std::string_view to_string(UploadRejection rejection) noexcept {
  switch (rejection) {
    case UploadRejection::UnsupportedType: return "unsupported file type";
    case UploadRejection::TooLarge: return "file too large";
    case UploadRejection::NoFiles: return "no files provided";
    case UploadRejection::TooManyFiles: return "too many files";
  }
  return "unknown";
}

std::expected<void, UploadRejection> validate_upload(const lc::Document& document,
                                                     const PipelineConfig& config) {
  if (!allowed_type(document)) {
    return std::unexpected(UploadRejection::UnsupportedType);
  }
  if (document.bytes.size() > config.max_upload_bytes) {
    return std::unexpected(UploadRejection::TooLarge);
  }
  return {};
}

std::expected<BulkReport, UploadRejection> extract_documents(
    const std::vector<lc::Document>& documents,
    const labscan::vision::DocumentDecoder& decoder,
    lc::Pipeline& pipeline,
    const PipelineConfig& config,
    const RunOptions& options) {
  if (documents.empty()) {
    return std::unexpected(UploadRejection::NoFiles);
  }
  if (documents.size() > config.max_files_per_batch) {
    spdlog::warn("bulk: {} files exceeds the limit of {}", documents.size(),
                 config.max_files_per_batch);
    return std::unexpected(UploadRejection::TooManyFiles);
  }

  BulkReport report;
  report.total_files = documents.size();
  report.results.reserve(documents.size());

  for (const auto& document : documents) {
    FileReport file;
    file.filename = document.filename.empty() ? "unknown" : document.filename;

    if (auto valid = validate_upload(document, config); !valid) {
      file.error = rejection_message(valid.error(), document, config);
      spdlog::warn("bulk: {} rejected: {}", file.filename, *file.error);
      ++report.failed;
      report.results.push_back(std::move(file));
      continue;
    }

    spdlog::info("bulk: processing {} ({} bytes)", file.filename, document.bytes.size());
    lc::ExtractionResult result = extract_document(decoder, pipeline, document, options);
    if (result.markers.empty()) {
      file.error = std::string(kNoMarkersMessage);
      ++report.failed;
    } else {
      file.success = true;
      ++report.successful;
      report.total_markers += result.markers.size();
    }
    file.result = std::move(result);
    report.results.push_back(std::move(file));
  }
  return report;
}

}  // namespace labscan::app

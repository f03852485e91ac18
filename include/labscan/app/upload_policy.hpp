#pragma once

#include <labscan/app/config.hpp>
#include <labscan/app/pipeline_runner.hpp>
#include <labscan/core/document.hpp>
#include <labscan/core/extraction_result.hpp>
#include <labscan/core/pipeline.hpp>
#include <labscan/vision/document_decoder.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labscan::app {

/// Why a file or batch was refused before extraction.
enum class UploadRejection {
  UnsupportedType,
  TooLarge,
  NoFiles,
  TooManyFiles,
};

[[nodiscard]] std::string_view to_string(UploadRejection rejection) noexcept;

/// Accepts PDF, PNG, JPEG, GIF, WebP and TIFF, by content type or by filename
/// extension, up to config.max_upload_bytes.
[[nodiscard]] std::expected<void, UploadRejection> validate_upload(
    const labscan::core::Document& document, const PipelineConfig& config);

/// Per-file outcome of a bulk run. success means at least one marker.
struct FileReport {
  std::string filename;
  bool success{false};
  std::optional<labscan::core::ExtractionResult> result;  // absent when rejected
  std::optional<std::string> error;
};

struct BulkReport {
  std::size_t total_files{0};
  std::size_t successful{0};
  std::size_t failed{0};
  std::size_t total_markers{0};
  std::vector<FileReport> results;  // same order as the input
};

/// Validates and extracts each document in turn. The whole batch is refused
/// when it is empty or exceeds config.max_files_per_batch.
[[nodiscard]] std::expected<BulkReport, UploadRejection> extract_documents(
    const std::vector<labscan::core::Document>& documents,
    const labscan::vision::DocumentDecoder& decoder,
    labscan::core::Pipeline& pipeline,
    const PipelineConfig& config,
    const RunOptions& options = {});

}  // namespace labscan::app

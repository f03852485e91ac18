#include <labscan/vision/document_decoder.hpp>
#include "page_cv_utils.hpp"
#include <labscan/core/alias_table.hpp>
#include <labscan/core/base64.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace labscan::vision {

namespace lc = labscan::core;

bool is_paginated_document(std::string_view content_type, std::string_view filename) {
  if (lc::to_lower(lc::trim_copy(content_type)) == "application/pdf") return true;
  return lc::to_lower(filename).ends_with(".pdf");
}

std::expected<lc::Page, lc::PipelineError> decode_image(std::span<const std::byte> bytes) {
  if (bytes.empty()) {
    return std::unexpected(lc::PipelineError::DecodeFailed);
  }

  cv::Mat decoded;
  try {
    const cv::Mat encoded(1, static_cast<int>(bytes.size()), CV_8UC1,
                          const_cast<std::byte*>(bytes.data()));
    decoded = cv::imdecode(encoded, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    spdlog::warn("image decode failed: {}", e.what());
    return std::unexpected(lc::PipelineError::DecodeFailed);
  }
  if (decoded.empty()) {
    return std::unexpected(lc::PipelineError::DecodeFailed);
  }
  return detail::mat_to_page(decoded, detail::format_for_channels(decoded.channels()));
}

std::expected<std::vector<std::byte>, lc::PipelineError> encode_png(const lc::Page& page) {
  const auto mat = detail::page_to_mat(page);
  if (!mat || mat->empty()) {
    return std::unexpected(lc::PipelineError::InvalidPage);
  }

  std::vector<uchar> encoded;
  try {
    cv::Mat source = *mat;
    if (page.format() == lc::PixelFormat::RGB8) {
      cv::cvtColor(*mat, source, cv::COLOR_RGB2BGR);
    }
    if (!cv::imencode(".png", source, encoded)) {
      return std::unexpected(lc::PipelineError::DecodeFailed);
    }
  } catch (const cv::Exception& e) {
    spdlog::warn("page {}: png encode failed: {}", page.index(), e.what());
    return std::unexpected(lc::PipelineError::DecodeFailed);
  }

  std::vector<std::byte> out(encoded.size());
  std::transform(encoded.begin(), encoded.end(), out.begin(),
                 [](uchar b) { return static_cast<std::byte>(b); });
  return out;
}

std::expected<std::vector<std::byte>, lc::PipelineError> decode_base64_payload(
    std::string_view payload) {
  // data URL: keep what follows the first comma
  if (const auto comma = payload.find(','); comma != std::string_view::npos) {
    payload.remove_prefix(comma + 1);
  }
  auto bytes = lc::base64_decode(payload);
  if (!bytes || bytes->empty()) {
    return std::unexpected(lc::PipelineError::DecodeFailed);
  }
  return std::move(*bytes);
}

DocumentDecoder::DocumentDecoder(std::shared_ptr<IDocumentRasterizer> rasterizer,
                                 double render_scale)
    : rasterizer_(std::move(rasterizer)), render_scale_(render_scale) {}

std::expected<std::vector<lc::Page>, lc::PipelineError> DocumentDecoder::decode(
    const lc::Document& document) const {
  if (document.bytes.empty()) {
    return std::unexpected(lc::PipelineError::DecodeFailed);
  }

  if (!is_paginated_document(document.content_type, document.filename)) {
    auto page = decode_image(document.bytes);
    if (!page) {
      return std::unexpected(page.error());
    }
    std::vector<lc::Page> pages;
    pages.push_back(std::move(*page));
    return pages;
  }

  if (!rasterizer_) {
    spdlog::error("{}: paginated document but no rasterizer configured", document.filename);
    return std::unexpected(lc::PipelineError::InvalidConfig);
  }

  auto pages = rasterizer_->rasterize(document.bytes, render_scale_);
  if (!pages) {
    return std::unexpected(pages.error());
  }
  if (pages->empty()) {
    return std::unexpected(lc::PipelineError::DecodeFailed);
  }
  for (std::size_t i = 0; i < pages->size(); ++i) {
    (*pages)[i].set_index(i);
  }
  spdlog::info("{}: rasterized {} pages", document.filename, pages->size());
  return pages;
}

}  // namespace labscan::vision

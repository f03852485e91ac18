#include <labscan/vision/poppler_rasterizer.hpp>
#include "page_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page.h>
#include <poppler-page-renderer.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>

namespace labscan::vision {

namespace lc = labscan::core;

namespace {

constexpr double kBaseDpi = 72.0;

/// Copy a rendered poppler image into a BGR8 Mat. nullopt for formats we cannot read.
std::optional<cv::Mat> image_to_bgr(const poppler::image& image) {
  const int width = image.width();
  const int height = image.height();
  if (width <= 0 || height <= 0) return std::nullopt;

  // poppler::image::data() is non-const only; const_data() is the read view.
  auto* pixels = const_cast<char*>(image.const_data());
  const auto stride = static_cast<std::size_t>(image.bytes_per_row());

  cv::Mat bgr;
  switch (image.format()) {
    case poppler::image::format_argb32: {
      // Stored as native-endian 0xAARRGGBB, i.e. B,G,R,A bytes on little endian.
      const cv::Mat view(height, width, CV_8UC4, pixels, stride);
      cv::cvtColor(view, bgr, cv::COLOR_BGRA2BGR);
      break;
    }
    case poppler::image::format_rgb24: {
      const cv::Mat view(height, width, CV_8UC3, pixels, stride);
      cv::cvtColor(view, bgr, cv::COLOR_RGB2BGR);
      break;
    }
    case poppler::image::format_gray8: {
      const cv::Mat view(height, width, CV_8UC1, pixels, stride);
      cv::cvtColor(view, bgr, cv::COLOR_GRAY2BGR);
      break;
    }
    default:
      return std::nullopt;
  }
  return bgr;
}

}  // namespace

std::expected<std::vector<lc::Page>, lc::PipelineError>
PopplerRasterizer::rasterize(std::span<const std::byte> bytes, double scale) {
  if (bytes.empty() || scale <= 0.0) {
    return std::unexpected(lc::PipelineError::DecodeFailed);
  }

  std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(
      reinterpret_cast<const char*>(bytes.data()), static_cast<int>(bytes.size())));
  if (!doc) {
    spdlog::warn("pdf: could not parse document ({} bytes)", bytes.size());
    return std::unexpected(lc::PipelineError::DecodeFailed);
  }
  if (doc->is_locked()) {
    spdlog::warn("pdf: document is encrypted");
    return std::unexpected(lc::PipelineError::DecodeFailed);
  }

  poppler::page_renderer renderer;
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);

  const double dpi = kBaseDpi * scale;
  const int page_count = doc->pages();
  std::vector<lc::Page> pages;
  pages.reserve(static_cast<std::size_t>(page_count > 0 ? page_count : 0));

  for (int i = 0; i < page_count; ++i) {
    std::unique_ptr<poppler::page> page(doc->create_page(i));
    if (!page) {
      spdlog::warn("pdf: page {} could not be loaded", i);
      return std::unexpected(lc::PipelineError::DecodeFailed);
    }
    const poppler::image image = renderer.render_page(page.get(), dpi, dpi);
    if (!image.is_valid()) {
      spdlog::warn("pdf: page {} failed to render", i);
      return std::unexpected(lc::PipelineError::DecodeFailed);
    }

    std::optional<cv::Mat> bgr;
    try {
      bgr = image_to_bgr(image);
    } catch (const cv::Exception& e) {
      spdlog::warn("pdf: page {} conversion failed: {}", i, e.what());
      return std::unexpected(lc::PipelineError::DecodeFailed);
    }
    if (!bgr) {
      spdlog::warn("pdf: page {} rendered in an unsupported pixel format", i);
      return std::unexpected(lc::PipelineError::DecodeFailed);
    }
    pages.push_back(detail::mat_to_page(*bgr, lc::PixelFormat::BGR8,
                                        static_cast<std::size_t>(i)));
  }
  return pages;
}

}  // namespace labscan::vision

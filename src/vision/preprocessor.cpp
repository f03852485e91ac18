#include <labscan/vision/preprocessor.hpp>
#include "page_cv_utils.hpp"
#include <labscan/core/error.hpp>
#include <labscan/core/page.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <new>

namespace labscan::vision {

namespace {

using labscan::core::Page;
using labscan::core::PipelineError;
using labscan::core::PixelFormat;

std::expected<cv::Mat, PipelineError> to_grayscale(const cv::Mat& in, PixelFormat format) {
  cv::Mat gray;
  switch (format) {
    case PixelFormat::Grayscale8:
      gray = in.clone();
      break;
    case PixelFormat::BGR8:
      cv::cvtColor(in, gray, cv::COLOR_BGR2GRAY);
      break;
    case PixelFormat::RGB8:
      cv::cvtColor(in, gray, cv::COLOR_RGB2GRAY);
      break;
    case PixelFormat::BGRA8:
      cv::cvtColor(in, gray, cv::COLOR_BGRA2GRAY);
      break;
    case PixelFormat::Unknown:
    default:
      return std::unexpected(PipelineError::InvalidPage);
  }
  return gray;
}

/// Blend toward the mean gray level; factor 1 is identity.
cv::Mat enhance_contrast(const cv::Mat& gray, double factor) {
  const double mean = std::floor(cv::mean(gray)[0] + 0.5);
  cv::Mat out;
  gray.convertTo(out, CV_8U, factor, mean * (1.0 - factor));
  return out;
}

/// Blend toward black.
cv::Mat enhance_brightness(const cv::Mat& gray, double factor) {
  cv::Mat out;
  gray.convertTo(out, CV_8U, factor, 0.0);
  return out;
}

/// Blend toward a 3x3 smoothed copy (center weight 5, total 13).
cv::Mat enhance_sharpness(const cv::Mat& gray, double factor) {
  static const cv::Mat kSmooth = (cv::Mat_<float>(3, 3) << 1, 1, 1,
                                                           1, 5, 1,
                                                           1, 1, 1) / 13.f;
  cv::Mat smooth;
  cv::filter2D(gray, smooth, -1, kSmooth, cv::Point(-1, -1), 0.0, cv::BORDER_REPLICATE);
  cv::Mat out;
  cv::addWeighted(gray, factor, smooth, 1.0 - factor, 0.0, out);
  return out;
}

cv::Mat enhance(const cv::Mat& gray, PreprocessStrategy strategy) {
  switch (strategy) {
    case PreprocessStrategy::Standard: {
      cv::Mat out = enhance_contrast(gray, 1.5);
      return enhance_sharpness(out, 1.5);
    }
    case PreprocessStrategy::HighContrast: {
      cv::Mat out = enhance_contrast(gray, 2.5);
      out = enhance_brightness(out, 1.2);
      return enhance_sharpness(out, 2.0);
    }
    case PreprocessStrategy::Photo: {
      cv::Mat out = enhance_brightness(gray, 1.1);
      out = enhance_contrast(out, 2.0);
      cv::Mat denoised;
      cv::medianBlur(out, denoised, 3);
      return enhance_sharpness(denoised, 2.5);
    }
  }
  return gray;
}

}  // namespace

std::string_view to_string(PreprocessStrategy strategy) noexcept {
  switch (strategy) {
    case PreprocessStrategy::Standard:
      return "standard";
    case PreprocessStrategy::HighContrast:
      return "high_contrast";
    case PreprocessStrategy::Photo:
      return "photo";
  }
  return "unknown";
}

PageDimensions bounded_dimensions(std::uint32_t width,
                                  std::uint32_t height,
                                  const PreprocessConfig& config) {
  double w = static_cast<double>(width);
  double h = static_cast<double>(height);

  const double smaller = std::min(w, h);
  if (smaller > 0.0 && smaller < static_cast<double>(config.min_dimension)) {
    const double scale = static_cast<double>(config.min_dimension) / smaller;
    w = std::floor(w * scale);
    h = std::floor(h * scale);
  }

  const double larger = std::max(w, h);
  if (larger > static_cast<double>(config.max_dimension)) {
    const double scale = static_cast<double>(config.max_dimension) / larger;
    w = std::floor(w * scale);
    h = std::floor(h * scale);
  }

  return PageDimensions{static_cast<std::uint32_t>(std::max(w, 1.0)),
                        static_cast<std::uint32_t>(std::max(h, 1.0))};
}

Preprocessor::Preprocessor(PreprocessConfig config) : config_(config) {}

std::expected<Page, PipelineError> Preprocessor::apply(const Page& page,
                                                       PreprocessStrategy strategy) const {
  if (page.empty()) {
    return std::unexpected(PipelineError::InvalidPage);
  }

  auto mat_in = detail::page_to_mat(page);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidPage);
  }

  const PageDimensions target = bounded_dimensions(page.width(), page.height(), config_);
  try {
    auto gray = to_grayscale(*mat_in, page.format());
    if (!gray) {
      return std::unexpected(gray.error());
    }

    cv::Mat sized;
    if (target.width != page.width() || target.height != page.height()) {
      cv::resize(*gray, sized,
                 cv::Size(static_cast<int>(target.width), static_cast<int>(target.height)),
                 0, 0, cv::INTER_LANCZOS4);
    } else {
      sized = std::move(*gray);
    }

    cv::Mat enhanced = enhance(sized, strategy);

    cv::Mat binary;
    cv::threshold(enhanced, binary, static_cast<double>(config_.binarize_threshold), 255.0,
                  cv::THRESH_BINARY);

    return detail::mat_to_page(binary, PixelFormat::Grayscale8, page.index());
  } catch (const cv::Exception& e) {
    spdlog::warn("page {}: preprocess strategy={} raised: {}", page.index(), to_string(strategy),
                 e.what());
  } catch (const std::bad_alloc&) {
    spdlog::warn("page {}: preprocess strategy={} out of memory", page.index(),
                 to_string(strategy));
  }
  return std::unexpected(PipelineError::PreprocessFailed);
}

std::vector<PreprocessedVariant> Preprocessor::apply_all(const Page& page) const {
  std::vector<PreprocessedVariant> out;
  out.reserve(kPreprocessStrategies.size());
  for (const auto strategy : kPreprocessStrategies) {
    auto processed = apply(page, strategy);
    if (!processed) {
      spdlog::debug("preprocess strategy={} failed: {}", to_string(strategy),
                    labscan::core::to_string(processed.error()));
      continue;
    }
    out.push_back(PreprocessedVariant{strategy, std::move(*processed)});
  }
  return out;
}

}  // namespace labscan::vision

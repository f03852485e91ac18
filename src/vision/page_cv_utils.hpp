#pragma once

#include <labscan/core/page.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace labscan::vision::detail {

/// Wrap a Page as cv::Mat (shared view, no copy). Returns nullopt if format unsupported.
std::optional<cv::Mat> page_to_mat(const labscan::core::Page& page);

/// Convert cv::Mat to Page (copy). Keeps the given page index.
labscan::core::Page mat_to_page(const cv::Mat& mat,
                                labscan::core::PixelFormat format,
                                std::size_t index = 0);

/// Pixel format matching a decoded 8-bit Mat's channel count (1 -> gray, 3 -> BGR, 4 -> BGRA).
labscan::core::PixelFormat format_for_channels(int channels);

}  // namespace labscan::vision::detail

#include "page_cv_utils.hpp"
#include <labscan/core/page.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace labscan::vision::detail {

namespace lc = labscan::core;

std::optional<cv::Mat> page_to_mat(const lc::Page& page) {
  if (page.empty() || page.height() == 0) return std::nullopt;
  if (page.size_bytes() < lc::Page::min_bytes(page.width(), page.height(), page.format())) {
    return std::nullopt;
  }

  const int w = static_cast<int>(page.width());
  const int h = static_cast<int>(page.height());
  const std::size_t step = page.size_bytes() / static_cast<std::size_t>(h);
  auto* data = const_cast<std::byte*>(page.data().data());

  switch (page.format()) {
    case lc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case lc::PixelFormat::RGB8:
    case lc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case lc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case lc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

lc::Page mat_to_page(const cv::Mat& mat, lc::PixelFormat format, std::size_t index) {
  if (mat.empty()) return lc::Page();

  const cv::Mat contiguous = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(contiguous.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(contiguous.rows);
  const std::size_t len = contiguous.total() * contiguous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), contiguous.ptr(), len);
  return lc::Page(w, h, format, std::move(buffer), index);
}

lc::PixelFormat format_for_channels(int channels) {
  switch (channels) {
    case 1:
      return lc::PixelFormat::Grayscale8;
    case 3:
      return lc::PixelFormat::BGR8;
    case 4:
      return lc::PixelFormat::BGRA8;
    default:
      return lc::PixelFormat::Unknown;
  }
}

}  // namespace labscan::vision::detail

#include <labscan/core/page.hpp>
#include <labscan/vision/preprocessor.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <expected>
#include <vector>

namespace lc = labscan::core;
namespace lv = labscan::vision;

namespace {

lc::Page uniform_bgr(std::uint32_t w, std::uint32_t h, std::uint8_t value, std::size_t index = 0) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h * 3, std::byte{value});
  return lc::Page(w, h, lc::PixelFormat::BGR8, std::move(buf), index);
}

bool all_bytes_equal(const lc::Page& p, std::byte value) {
  const auto data = p.data();
  return std::all_of(data.begin(), data.end(), [&](std::byte b) { return b == value; });
}

const lv::PreprocessConfig kSmall{8, 64, 128};

}  // namespace

TEST(BoundedDimensions, UpscalesSmallerSideToFloor) {
  const auto d = lv::bounded_dimensions(1000, 500, lv::PreprocessConfig{});
  EXPECT_EQ(d.width, 3000u);
  EXPECT_EQ(d.height, 1500u);
}

TEST(BoundedDimensions, DownscalesLargerSideToCeiling) {
  const auto d = lv::bounded_dimensions(2000, 8000, lv::PreprocessConfig{});
  EXPECT_EQ(d.width, 1000u);
  EXPECT_EQ(d.height, 4000u);
}

TEST(BoundedDimensions, InRangeUnchanged) {
  const auto d = lv::bounded_dimensions(3000, 2000, lv::PreprocessConfig{});
  EXPECT_EQ(d.width, 3000u);
  EXPECT_EQ(d.height, 2000u);
}

TEST(Preprocessor, OutputIsBinarizedGrayscaleWithinBounds) {
  lv::Preprocessor pre(kSmall);
  auto out = pre.apply(uniform_bgr(4, 4, 200, 3), lv::PreprocessStrategy::Standard);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), lc::PixelFormat::Grayscale8);
  EXPECT_EQ(out->width(), 8u);
  EXPECT_EQ(out->height(), 8u);
  EXPECT_EQ(out->index(), 3u);
  EXPECT_TRUE(all_bytes_equal(*out, std::byte{255}));
}

TEST(Preprocessor, DarkPageBinarizesToBlackForEveryStrategy) {
  lv::Preprocessor pre(kSmall);
  for (const auto strategy : lv::kPreprocessStrategies) {
    auto out = pre.apply(uniform_bgr(16, 16, 50), strategy);
    ASSERT_TRUE(out.has_value()) << lv::to_string(strategy);
    EXPECT_TRUE(all_bytes_equal(*out, std::byte{0})) << lv::to_string(strategy);
  }
}

TEST(Preprocessor, ApplyAllProducesEveryStrategyInOrder) {
  lv::Preprocessor pre(kSmall);
  const auto variants = pre.apply_all(uniform_bgr(16, 16, 200));
  ASSERT_EQ(variants.size(), 3u);
  EXPECT_EQ(variants[0].strategy, lv::PreprocessStrategy::Standard);
  EXPECT_EQ(variants[1].strategy, lv::PreprocessStrategy::HighContrast);
  EXPECT_EQ(variants[2].strategy, lv::PreprocessStrategy::Photo);
  for (const auto& v : variants) {
    EXPECT_TRUE(all_bytes_equal(v.image, std::byte{255}));
  }
}

TEST(Preprocessor, RejectsEmptyAndUnknownPages) {
  lv::Preprocessor pre(kSmall);
  auto empty = pre.apply(lc::Page(), lv::PreprocessStrategy::Standard);
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), lc::PipelineError::InvalidPage);

  lc::Page unknown(2, 2, lc::PixelFormat::Unknown, std::vector<std::byte>(4));
  auto out = pre.apply(unknown, lv::PreprocessStrategy::Photo);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), lc::PipelineError::InvalidPage);
}

TEST(Preprocessor, OpenCvFailureIsReportedNotThrown) {
  // Target side exceeds int range, which cv::resize rejects.
  lv::Preprocessor pre(lv::PreprocessConfig{3'000'000'000u, 4'000'000'000u, 128});
  for (const auto strategy : lv::kPreprocessStrategies) {
    std::expected<lc::Page, lc::PipelineError> out = std::unexpected(lc::PipelineError::None);
    EXPECT_NO_THROW(out = pre.apply(uniform_bgr(1, 1, 200), strategy));
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error(), lc::PipelineError::PreprocessFailed);
  }
  EXPECT_TRUE(pre.apply_all(uniform_bgr(1, 1, 200)).empty());
}

TEST(Preprocessor, StrategyNames) {
  EXPECT_EQ(lv::to_string(lv::PreprocessStrategy::Standard), "standard");
  EXPECT_EQ(lv::to_string(lv::PreprocessStrategy::HighContrast), "high_contrast");
  EXPECT_EQ(lv::to_string(lv::PreprocessStrategy::Photo), "photo");
}

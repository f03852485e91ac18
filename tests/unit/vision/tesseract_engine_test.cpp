#include <labscan/core/page.hpp>
#include <labscan/vision/document_decoder.hpp>
#include <labscan/vision/tesseract_engine.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace lc = labscan::core;
namespace lv = labscan::vision;

namespace {

std::string get_test_image_path() {
  const char* p = std::getenv("LABSCAN_TEST_OCR_IMAGE");
  return p ? std::string(p) : std::string();
}

lc::Page load_page(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  const std::vector<char> raw{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  std::vector<std::byte> bytes(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) bytes[i] = static_cast<std::byte>(raw[i]);
  auto page = lv::decode_image(bytes);
  return page ? std::move(*page) : lc::Page();
}

}  // namespace

// --- Tests that run without language data ---

TEST(TesseractEngine, ConstructorThrowsForMissingLanguage) {
  EXPECT_THROW(lv::TesseractEngine("zz_no_such_language_12345"), std::runtime_error);
}

// --- Tests that need eng language data and a sample image ---

TEST(TesseractEngine, RejectsEmptyPage) {
  const std::string path = get_test_image_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set LABSCAN_TEST_OCR_IMAGE to run (path to an image with printed text)";
  }
  lv::TesseractEngine engine;
  auto out = engine.recognize(lc::Page(), lv::LayoutMode::AutoSegment);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), lc::PipelineError::InvalidPage);
}

TEST(TesseractEngine, RepeatedCallsAcrossLayoutModesReuseOneEngine) {
  const std::string path = get_test_image_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set LABSCAN_TEST_OCR_IMAGE to run (path to an image with printed text)";
  }
  const lc::Page page = load_page(path);
  ASSERT_FALSE(page.empty());

  lv::TesseractEngine engine;
  std::vector<std::string> texts;
  for (int round = 0; round < 2; ++round) {
    for (const auto mode : lv::kLayoutModes) {
      auto text = engine.recognize(page, mode);
      ASSERT_TRUE(text.has_value()) << lv::to_string(mode);
      texts.push_back(*text);
    }
  }
  for (const auto& t : texts) EXPECT_FALSE(t.empty());
  // Same page, same mode: state from earlier calls does not leak into later ones.
  for (std::size_t i = 0; i < lv::kLayoutModes.size(); ++i) {
    EXPECT_EQ(texts[i], texts[i + lv::kLayoutModes.size()]);
  }
}

TEST(TesseractEngine, SharedAcrossThreads) {
  const std::string path = get_test_image_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set LABSCAN_TEST_OCR_IMAGE to run (path to an image with printed text)";
  }
  const lc::Page page = load_page(path);
  ASSERT_FALSE(page.empty());

  lv::TesseractEngine engine;
  auto expected = engine.recognize(page, lv::LayoutMode::SingleBlock);
  ASSERT_TRUE(expected.has_value());

  std::vector<std::string> results(3);
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&, i] {
      auto text = engine.recognize(page, lv::LayoutMode::SingleBlock);
      if (text) results[i] = *text;
    });
  }
  for (auto& t : threads) t.join();
  for (const auto& r : results) EXPECT_EQ(r, *expected);
}

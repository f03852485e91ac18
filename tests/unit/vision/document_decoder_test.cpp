#include <labscan/core/document.hpp>
#include <labscan/core/page.hpp>
#include <labscan/vision/document_decoder.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace lc = labscan::core;
namespace lv = labscan::vision;

namespace {

class FakeRasterizer : public lv::IDocumentRasterizer {
 public:
  explicit FakeRasterizer(std::size_t pages) : pages_(pages) {}

  std::expected<std::vector<lc::Page>, lc::PipelineError> rasterize(
      std::span<const std::byte>, double scale) override {
    last_scale = scale;
    std::vector<lc::Page> out;
    for (std::size_t i = 0; i < pages_; ++i) {
      // Deliberately wrong index; the decoder renumbers.
      out.emplace_back(2, 2, lc::PixelFormat::BGR8, std::vector<std::byte>(12), 99);
    }
    return out;
  }

  double last_scale{0.0};

 private:
  std::size_t pages_;
};

lc::Page gradient_page() {
  std::vector<std::byte> buf;
  for (int i = 0; i < 6 * 4 * 3; ++i) buf.push_back(static_cast<std::byte>(i * 3));
  return lc::Page(6, 4, lc::PixelFormat::BGR8, std::move(buf));
}

std::vector<std::byte> bytes_of(const std::string& s) {
  std::vector<std::byte> out;
  for (const char c : s) out.push_back(static_cast<std::byte>(c));
  return out;
}

}  // namespace

TEST(DocumentDecoder, PaginatedByContentTypeOrExtension) {
  EXPECT_TRUE(lv::is_paginated_document("application/pdf", "scan"));
  EXPECT_TRUE(lv::is_paginated_document("", "REPORT.PDF"));
  EXPECT_FALSE(lv::is_paginated_document("image/png", "report.png"));
  EXPECT_FALSE(lv::is_paginated_document("", "pdf.png"));
}

TEST(DocumentDecoder, PngRoundTripKeepsPixels) {
  const lc::Page original = gradient_page();
  auto png = lv::encode_png(original);
  ASSERT_TRUE(png.has_value());

  auto decoded = lv::decode_image(*png);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->width(), 6u);
  EXPECT_EQ(decoded->height(), 4u);
  EXPECT_EQ(decoded->format(), lc::PixelFormat::BGR8);
  ASSERT_EQ(decoded->size_bytes(), original.size_bytes());
  EXPECT_TRUE(std::equal(original.data().begin(), original.data().end(),
                         decoded->data().begin()));
}

TEST(DocumentDecoder, CorruptImageFails) {
  auto garbage = lv::decode_image(bytes_of("definitely not an image"));
  ASSERT_FALSE(garbage.has_value());
  EXPECT_EQ(garbage.error(), lc::PipelineError::DecodeFailed);

  auto empty = lv::decode_image({});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), lc::PipelineError::DecodeFailed);
}

TEST(DocumentDecoder, Base64PlainAndDataUrl) {
  auto plain = lv::decode_base64_payload("Zm9v");
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(*plain, bytes_of("foo"));

  auto url = lv::decode_base64_payload("data:image/png;base64,Zm9v");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(*url, bytes_of("foo"));

  auto bad = lv::decode_base64_payload("data:image/png;base64,@@@");
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), lc::PipelineError::DecodeFailed);
}

TEST(DocumentDecoder, ImageDocumentIsOnePage) {
  lv::DocumentDecoder decoder(nullptr);
  lc::Document doc{*lv::encode_png(gradient_page()), "scan.png", "image/png"};
  auto pages = decoder.decode(doc);
  ASSERT_TRUE(pages.has_value());
  ASSERT_EQ(pages->size(), 1u);
  EXPECT_EQ(pages->front().index(), 0u);
}

TEST(DocumentDecoder, PdfGoesThroughRasterizerAtRenderScale) {
  auto rasterizer = std::make_shared<FakeRasterizer>(3);
  lv::DocumentDecoder decoder(rasterizer);
  lc::Document doc{bytes_of("%PDF-1.4"), "panel.pdf", "application/pdf"};
  auto pages = decoder.decode(doc);
  ASSERT_TRUE(pages.has_value());
  ASSERT_EQ(pages->size(), 3u);
  for (std::size_t i = 0; i < pages->size(); ++i) {
    EXPECT_EQ((*pages)[i].index(), i);
  }
  EXPECT_DOUBLE_EQ(rasterizer->last_scale, 2.0);
  EXPECT_DOUBLE_EQ(decoder.render_scale(), 2.0);
}

TEST(DocumentDecoder, PdfWithoutRasterizerIsConfigError) {
  lv::DocumentDecoder decoder(nullptr);
  lc::Document doc{bytes_of("%PDF-1.4"), "panel.pdf", "application/pdf"};
  auto pages = decoder.decode(doc);
  ASSERT_FALSE(pages.has_value());
  EXPECT_EQ(pages.error(), lc::PipelineError::InvalidConfig);
}

TEST(DocumentDecoder, PdfWithNoPagesFails) {
  lv::DocumentDecoder decoder(std::make_shared<FakeRasterizer>(0));
  lc::Document doc{bytes_of("%PDF-1.4"), "empty.pdf", "application/pdf"};
  auto pages = decoder.decode(doc);
  ASSERT_FALSE(pages.has_value());
  EXPECT_EQ(pages.error(), lc::PipelineError::DecodeFailed);
}

TEST(DocumentDecoder, EmptyDocumentFails) {
  lv::DocumentDecoder decoder(nullptr);
  auto pages = decoder.decode(lc::Document{});
  ASSERT_FALSE(pages.has_value());
  EXPECT_EQ(pages.error(), lc::PipelineError::DecodeFailed);
}

#include <labscan/app/config.hpp>
#include <labscan/app/pipeline_factory.hpp>
#include <labscan/app/pipeline_runner.hpp>
#include <labscan/core/document.hpp>
#include <labscan/core/page.hpp>
#include <labscan/core/pipeline.hpp>
#include <labscan/llm/mock_chat_client.hpp>
#include <labscan/vision/document_decoder.hpp>
#include <labscan/vision/mock_recognition_engine.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace {

using namespace labscan::core;
using namespace labscan::vision;
using namespace labscan::app;
using labscan::llm::MockChatClient;

constexpr const char* kReportText =
    "COMPREHENSIVE METABOLIC PANEL\n"
    "Glucose 95 mg/dL (70-100)\n"
    "Creatinine 0.9 mg/dL (0.6-1.2)\n"
    "HDL: 55 mg/dL\n";

class FakePdfRasterizer : public IDocumentRasterizer {
 public:
  explicit FakePdfRasterizer(std::size_t pages) : pages_(pages) {}

  std::expected<std::vector<Page>, PipelineError> rasterize(std::span<const std::byte>,
                                                            double) override {
    std::vector<Page> out;
    for (std::size_t i = 0; i < pages_; ++i) {
      out.emplace_back(32, 32, PixelFormat::BGR8, std::vector<std::byte>(32 * 32 * 3, std::byte{255}));
    }
    return out;
  }

 private:
  std::size_t pages_;
};

PipelineConfig test_config() {
  PipelineConfig config;
  config.min_dimension = 16;
  config.max_dimension = 64;
  return config;
}

Document png_document() {
  const Page page(32, 32, PixelFormat::BGR8, std::vector<std::byte>(32 * 32 * 3, std::byte{255}));
  Document doc;
  doc.filename = "report.png";
  doc.content_type = "image/png";
  if (auto png = encode_png(page)) doc.bytes = std::move(*png);
  return doc;
}

struct Harness {
  std::shared_ptr<MockRecognitionEngine> engine = std::make_shared<MockRecognitionEngine>();
  std::shared_ptr<MockChatClient> chat = std::make_shared<MockChatClient>();
};

}  // namespace

TEST(FullPipelineTest, StructuredParserHandlesCleanText) {
  Harness h;
  h.engine->set_text(kReportText);
  h.chat->enqueue(std::string(
      R"({"markers": [{"name": "Glucose", "value": 95, "unit": "mg/dL", "reference_low": 70,)"
      R"( "reference_high": 100}, {"name": "HDL", "value": 55, "unit": "mg/dL"}], "confidence": 0.95})"));
  const PipelineConfig config = test_config();
  Pipeline pipeline = build_pipeline(config, h.engine, h.chat);
  const DocumentDecoder decoder(nullptr);

  const auto result = extract_document(decoder, pipeline, png_document());
  ASSERT_EQ(result.markers.size(), 2u);
  EXPECT_EQ(result.markers[0].name, "Glucose");
  EXPECT_EQ(result.markers[1].name, "HDL Cholesterol");
  EXPECT_DOUBLE_EQ(result.confidence, 0.95);
  ASSERT_TRUE(result.raw_text.has_value());
  EXPECT_NE(result.raw_text->find("Creatinine"), std::string::npos);
  EXPECT_EQ(h.chat->call_count(), 1u);
}

TEST(FullPipelineTest, PatternFallbackWhenModelFindsNothing) {
  Harness h;
  h.engine->set_text(kReportText);
  const PipelineConfig config = test_config();
  Pipeline pipeline = build_pipeline(config, h.engine, h.chat);
  const DocumentDecoder decoder(nullptr);

  const auto result = extract_document(decoder, pipeline, png_document());
  ASSERT_EQ(result.markers.size(), 3u);
  EXPECT_EQ(result.markers[0].name, "Glucose");
  EXPECT_EQ(result.markers[0].reference_low, 70.0);
  EXPECT_EQ(result.markers[1].name, "Creatinine");
  EXPECT_EQ(result.markers[2].name, "HDL Cholesterol");
  EXPECT_DOUBLE_EQ(result.confidence, 0.5);
}

TEST(FullPipelineTest, VisionFallbackOnUnreadableText) {
  Harness h;
  h.engine->set_text("~~ %% ##");
  h.chat->set_vision_reply(std::string(
      R"({"markers": [{"name": "TSH", "value": 2.1, "unit": "mIU/L"}], "confidence": 0.6})"));
  const PipelineConfig config = test_config();
  Pipeline pipeline = build_pipeline(config, h.engine, h.chat);
  const DocumentDecoder decoder(nullptr);

  const auto result = extract_document(decoder, pipeline, png_document());
  ASSERT_EQ(result.markers.size(), 1u);
  EXPECT_EQ(result.markers[0].name, "TSH");
  EXPECT_DOUBLE_EQ(result.confidence, 0.6);
  const auto requests = h.chat->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_TRUE(requests[0].image.has_value());
}

TEST(FullPipelineTest, NothingReadableIsEmptyNotAnError) {
  Harness h;
  h.engine->set_text("~~ %% ##");
  PipelineConfig config = test_config();
  config.use_vision_fallback = false;
  Pipeline pipeline = build_pipeline(config, h.engine, h.chat);
  const DocumentDecoder decoder(nullptr);

  const auto result = extract_document(decoder, pipeline, png_document());
  EXPECT_TRUE(result.markers.empty());
  EXPECT_DOUBLE_EQ(result.confidence, 0.0);
  EXPECT_EQ(result.page_count, 1u);
  EXPECT_EQ(h.chat->call_count(), 0u);
}

TEST(FullPipelineTest, CorruptUploadYieldsEmptyResult) {
  Harness h;
  h.engine->set_text(kReportText);
  const PipelineConfig config = test_config();
  Pipeline pipeline = build_pipeline(config, h.engine, h.chat);
  const DocumentDecoder decoder(nullptr);

  Document doc;
  doc.filename = "broken.jpg";
  doc.content_type = "image/jpeg";
  doc.bytes.assign(64, std::byte{0x42});
  const auto result = extract_document(decoder, pipeline, doc);
  EXPECT_TRUE(result.markers.empty());
  EXPECT_FALSE(result.raw_text.has_value());
  EXPECT_DOUBLE_EQ(result.confidence, 0.0);
  EXPECT_EQ(h.engine->call_count(), 0u);
}

TEST(FullPipelineTest, MultiPagePdfMergesInPageOrder) {
  Harness h;
  h.engine->set_text(kReportText);
  h.chat->enqueue(std::string(R"({"markers": [{"name": "Glucose", "value": 98}], "confidence": 0.9})"));
  h.chat->enqueue(std::string(R"({"markers": [{"name": "HDL", "value": 55}], "confidence": 0.7})"));
  const PipelineConfig config = test_config();
  Pipeline pipeline = build_pipeline(config, h.engine, h.chat);
  const DocumentDecoder decoder(std::make_shared<FakePdfRasterizer>(2));

  Document doc;
  doc.filename = "panel.pdf";
  doc.content_type = "application/pdf";
  doc.bytes.assign(8, std::byte{0});
  const auto result = extract_document(decoder, pipeline, doc);

  ASSERT_EQ(result.markers.size(), 2u);
  EXPECT_EQ(result.markers[0].name, "Glucose");
  EXPECT_EQ(result.markers[1].name, "HDL Cholesterol");
  EXPECT_EQ(result.page_count, 2u);
  EXPECT_DOUBLE_EQ(result.confidence, 0.8);
  ASSERT_TRUE(result.raw_text.has_value());
  EXPECT_EQ(result.raw_text->rfind("--- Page 1 ---\n", 0), 0u);
  EXPECT_NE(result.raw_text->find("--- Page 2 ---\n"), std::string::npos);
}

TEST(FullPipelineTest, MockBackendsExtractFromDemoText) {
  PipelineConfig config = test_config();
  const Backends backends = make_backends(config);
  Pipeline pipeline = build_pipeline(config, backends.engine, backends.chat);
  const DocumentDecoder decoder = build_decoder(config, backends);

  const auto result = extract_document(decoder, pipeline, png_document());
  EXPECT_EQ(result.markers.size(), 4u);
  EXPECT_DOUBLE_EQ(result.confidence, 0.5);
}

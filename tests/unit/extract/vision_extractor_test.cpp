#include <labscan/core/alias_table.hpp>
#include <labscan/core/page.hpp>
#include <labscan/extract/vision_extractor.hpp>
#include <labscan/llm/mock_chat_client.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace lc = labscan::core;
namespace le = labscan::extract;
namespace ll = labscan::llm;

namespace {

lc::Page white_page() {
  return lc::Page(8, 8, lc::PixelFormat::BGR8, std::vector<std::byte>(8 * 8 * 3, std::byte{255}));
}

}  // namespace

TEST(VisionExtractor, SendsPageAsPngImage) {
  auto client = std::make_shared<ll::MockChatClient>();
  const le::VisionExtractor extractor(client, lc::AliasTable::builtin());

  ASSERT_TRUE(extractor.extract(white_page()).has_value());
  const auto requests = client->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].model, "llava:7b");
  ASSERT_TRUE(requests[0].image.has_value());
  EXPECT_EQ(requests[0].image->mime_type, "image/png");
  // base64 of the PNG signature
  EXPECT_EQ(requests[0].image->base64_data.rfind("iVBORw0KGgo", 0), 0u);
}

TEST(VisionExtractor, MarkersWithDefaultConfidence) {
  auto client = std::make_shared<ll::MockChatClient>();
  client->set_vision_reply(std::string(
      R"({"markers": [{"name": "hgb", "value": "13.5", "unit": "g/dL"}], "raw_text": "HGB 13.5"})"));
  const le::VisionExtractor extractor(client, lc::AliasTable::builtin());

  const auto outcome = extractor.extract(white_page());
  ASSERT_TRUE(outcome.has_value());
  ASSERT_EQ(outcome->markers.size(), 1u);
  EXPECT_EQ(outcome->markers[0].name, "Hemoglobin");
  EXPECT_DOUBLE_EQ(outcome->markers[0].value, 13.5);
  EXPECT_EQ(outcome->raw_text, "HGB 13.5");
  EXPECT_DOUBLE_EQ(outcome->confidence, 0.5);
}

TEST(VisionExtractor, EmptyMarkersMeanZeroConfidence) {
  auto client = std::make_shared<ll::MockChatClient>();
  client->set_vision_reply(std::string(R"({"markers": [], "confidence": 0.9})"));
  const le::VisionExtractor extractor(client, lc::AliasTable::builtin());

  const auto outcome = extractor.extract(white_page());
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->markers.empty());
  EXPECT_DOUBLE_EQ(outcome->confidence, 0.0);
}

TEST(VisionExtractor, ProseReplyKeptAsRawText) {
  auto client = std::make_shared<ll::MockChatClient>();
  client->set_vision_reply(std::string("The image shows a blurry lab report."));
  const le::VisionExtractor extractor(client, lc::AliasTable::builtin());

  const auto outcome = extractor.extract(white_page());
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->markers.empty());
  EXPECT_EQ(outcome->raw_text, "The image shows a blurry lab report.");
  EXPECT_DOUBLE_EQ(outcome->confidence, 0.3);
}

TEST(VisionExtractor, ErrorsPropagate) {
  auto client = std::make_shared<ll::MockChatClient>();
  client->enqueue(lc::PipelineError::TransportError);
  const le::VisionExtractor extractor(client, lc::AliasTable::builtin());

  const auto outcome = extractor.extract(white_page());
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error(), lc::PipelineError::TransportError);
}

TEST(VisionExtractor, InvalidPageIsRejectedBeforeSending) {
  auto client = std::make_shared<ll::MockChatClient>();
  const le::VisionExtractor extractor(client, lc::AliasTable::builtin());

  const auto outcome = extractor.extract(lc::Page{});
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(client->call_count(), 0u);
}

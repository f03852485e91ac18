#include <labscan/app/pipeline_factory.hpp>
#include <labscan/extract/pattern_fallback_stage.hpp>
#include <labscan/extract/structured_parse_stage.hpp>
#include <labscan/extract/vision_fallback_stage.hpp>
#include <labscan/llm/curl_chat_client.hpp>
#include <labscan/llm/mock_chat_client.hpp>
#include <labscan/vision/mock_recognition_engine.hpp>
#include <labscan/vision/poppler_rasterizer.hpp>
#include <labscan/vision/recognition_stage.hpp>
#include <labscan/vision/tesseract_engine.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace labscan::app {

namespace {

constexpr const char* kMockReportText =
    "COMPREHENSIVE METABOLIC PANEL\n"
    "Glucose 95 mg/dL (70-100)\n"
    "Creatinine 0.9 mg/dL (0.6-1.2)\n"
    "HDL: 55 mg/dL\n"
    "LDL 130 mg/dL (0-100)\n";

}  // namespace

Backends make_backends(const PipelineConfig& config) {
  Backends b;
  b.rasterizer = std::make_shared<labscan::vision::PopplerRasterizer>();

  if (config.backend == BackendType::Remote) {
    b.engine = std::make_shared<labscan::vision::TesseractEngine>(config.ocr_language,
                                                                  config.tessdata_path);
    b.chat = std::make_shared<labscan::llm::CurlChatClient>(
        labscan::llm::ChatEndpoint{config.llm_base_url, config.llm_api_key});
    spdlog::info("backend: remote ({}; text={}, vision={})", config.llm_base_url,
                 config.text_model, config.vision_model);
  } else {
    auto engine = std::make_shared<labscan::vision::MockRecognitionEngine>();
    engine->set_text(kMockReportText);
    b.engine = std::move(engine);
    b.chat = std::make_shared<labscan::llm::MockChatClient>();
    spdlog::info("backend: mock");
  }
  return b;
}

labscan::core::Pipeline build_pipeline(const PipelineConfig& config,
                                       std::shared_ptr<labscan::vision::IRecognitionEngine> engine,
                                       std::shared_ptr<labscan::llm::IChatClient> chat,
                                       const labscan::core::AliasTable& aliases) {
  if (!engine || !chat) {
    throw std::invalid_argument("build_pipeline: engine and chat client are required");
  }
  if (config.min_dimension == 0 || config.min_dimension > config.max_dimension) {
    throw std::invalid_argument("build_pipeline: min_dimension must be in [1, max_dimension]");
  }

  labscan::vision::PreprocessConfig pre;
  pre.min_dimension = config.min_dimension;
  pre.max_dimension = config.max_dimension;
  pre.binarize_threshold = config.binarize_threshold;

  labscan::extract::StructuredParserConfig parser_cfg;
  parser_cfg.model = config.text_model;
  parser_cfg.temperature = config.temperature;
  parser_cfg.timeout = std::chrono::seconds(config.structured_timeout_s);

  labscan::core::Pipeline pipeline;
  pipeline.add_stage(std::make_unique<labscan::vision::RecognitionStage>(
      labscan::vision::GridSearchRecognizer(engine, labscan::vision::Preprocessor(pre))));
  pipeline.add_stage(std::make_unique<labscan::extract::StructuredParseStage>(
      labscan::extract::StructuredParser(chat, aliases, parser_cfg), config.min_text_chars));
  pipeline.add_stage(std::make_unique<labscan::extract::PatternFallbackStage>(
      labscan::extract::PatternExtractor(aliases), config.min_text_chars));

  if (config.use_vision_fallback) {
    labscan::extract::VisionExtractorConfig vision_cfg;
    vision_cfg.model = config.vision_model;
    vision_cfg.temperature = config.temperature;
    vision_cfg.timeout = std::chrono::seconds(config.vision_timeout_s);
    pipeline.add_stage(std::make_unique<labscan::extract::VisionFallbackStage>(
        labscan::extract::VisionExtractor(chat, aliases, vision_cfg)));
  }
  return pipeline;
}

labscan::vision::DocumentDecoder build_decoder(const PipelineConfig& config,
                                               const Backends& backends) {
  return labscan::vision::DocumentDecoder(backends.rasterizer, config.render_scale);
}

}  // namespace labscan::app

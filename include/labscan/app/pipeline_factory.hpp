#pragma once

#include <labscan/app/config.hpp>
#include <labscan/core/alias_table.hpp>
#include <labscan/core/pipeline.hpp>
#include <labscan/llm/chat_client.hpp>
#include <labscan/vision/document_decoder.hpp>
#include <labscan/vision/recognition_engine.hpp>
#include <memory>

namespace labscan::app {

/// The external collaborators a pipeline is built from.
struct Backends {
  std::shared_ptr<labscan::vision::IRecognitionEngine> engine;
  std::shared_ptr<labscan::llm::IChatClient> chat;
  std::shared_ptr<labscan::vision::IDocumentRasterizer> rasterizer;
};

/// Backends for config.backend. Remote: Tesseract + libcurl chat client; mock:
/// MockRecognitionEngine + MockChatClient. PDF rasterization uses poppler either way.
/// Throws std::runtime_error if a production backend cannot be initialised.
[[nodiscard]] Backends make_backends(const PipelineConfig& config);

/// Fallback chain: recognition -> structured parse -> pattern fallback
/// [-> vision fallback when use_vision_fallback]. aliases must outlive the pipeline.
[[nodiscard]] labscan::core::Pipeline build_pipeline(
    const PipelineConfig& config,
    std::shared_ptr<labscan::vision::IRecognitionEngine> engine,
    std::shared_ptr<labscan::llm::IChatClient> chat,
    const labscan::core::AliasTable& aliases = labscan::core::AliasTable::builtin());

/// Decoder configured with the rasterizer and render_scale from config.
[[nodiscard]] labscan::vision::DocumentDecoder build_decoder(const PipelineConfig& config,
                                                             const Backends& backends);

}  // namespace labscan::app

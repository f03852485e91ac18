#pragma once

#include <labscan/vision/document_decoder.hpp>

namespace labscan::vision {

/// PDF rasterizer backed by poppler-cpp's page_renderer. Pages come out BGR8.
/// Stateless; each call loads its own document, so it is safe to share.
class PopplerRasterizer : public IDocumentRasterizer {
 public:
  [[nodiscard]] std::expected<std::vector<labscan::core::Page>,
                              labscan::core::PipelineError>
  rasterize(std::span<const std::byte> bytes, double scale) override;
};

}  // namespace labscan::vision

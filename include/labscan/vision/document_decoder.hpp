#pragma once

#include <labscan/core/document.hpp>
#include <labscan/core/error.hpp>
#include <labscan/core/page.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace labscan::vision {

/// Renders every page of a paginated document (PDF) to a raster Page.
/// scale is relative to 72 dpi (2.0 -> 144 dpi).
class IDocumentRasterizer {
 public:
  virtual ~IDocumentRasterizer() = default;

  [[nodiscard]] virtual std::expected<std::vector<labscan::core::Page>,
                                      labscan::core::PipelineError>
  rasterize(std::span<const std::byte> bytes, double scale) = 0;
};

/// True for application/pdf or a ".pdf" filename (case-insensitive).
[[nodiscard]] bool is_paginated_document(std::string_view content_type,
                                         std::string_view filename);

/// Decode an encoded raster image (PNG, JPEG, TIFF, ...) into a BGR8 Page.
[[nodiscard]] std::expected<labscan::core::Page, labscan::core::PipelineError>
decode_image(std::span<const std::byte> bytes);

/// PNG-encode a page (used to ship a page to the vision model).
[[nodiscard]] std::expected<std::vector<std::byte>, labscan::core::PipelineError>
encode_png(const labscan::core::Page& page);

/// Decode a base64 image payload, plain or as "data:<mime>;base64,<data>".
[[nodiscard]] std::expected<std::vector<std::byte>, labscan::core::PipelineError>
decode_base64_payload(std::string_view payload);

/// Document -> ordered pages. Paginated documents go through the rasterizer;
/// everything else is decoded as a single image. Page indexes are 0..N-1.
class DocumentDecoder {
 public:
  explicit DocumentDecoder(std::shared_ptr<IDocumentRasterizer> rasterizer,
                           double render_scale = 2.0);

  [[nodiscard]] std::expected<std::vector<labscan::core::Page>,
                              labscan::core::PipelineError>
  decode(const labscan::core::Document& document) const;

  [[nodiscard]] double render_scale() const noexcept { return render_scale_; }

 private:
  std::shared_ptr<IDocumentRasterizer> rasterizer_;
  double render_scale_;
};

}  // namespace labscan::vision

#pragma once

#include <labscan/core/error.hpp>
#include <labscan/core/extraction_result.hpp>
#include <labscan/core/page.hpp>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>

namespace labscan::core {

/// State handed from stage to stage while a page moves down the fallback chain.
/// page is borrowed from the caller of Pipeline::run and outlives the run.
struct PageContext {
  const Page* page{nullptr};
  std::string recognized_text;  // best OCR text; empty until recognition ran
  std::stop_token stop;
};

/// Output of a pipeline stage: either pass-through context or terminal PageResult.
using StageOutput = std::variant<PageContext, PageResult>;

/// Abstract pipeline stage: inspect the context, return it (continue with the
/// next stage) or a PageResult (done). An error means "this stage produced
/// nothing usable"; the pipeline logs it and moves on.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  /// Short identifier used in logs and timing output.
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  [[nodiscard]] virtual std::expected<StageOutput, PipelineError> process(
      const PageContext& input) = 0;
};

}  // namespace labscan::core

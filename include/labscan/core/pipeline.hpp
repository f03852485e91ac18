#pragma once

#include <labscan/core/extraction_result.hpp>
#include <labscan/core/page.hpp>
#include <labscan/core/pipeline_stage.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <stop_token>
#include <vector>

namespace labscan::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs the per-page fallback chain. Each stage runs at most once; the first
/// stage that returns a PageResult ends the run.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run the chain on one page. Never fails: stage errors and exceptions are
  /// logged and treated as "no result from this stage". When every stage is
  /// exhausted the result is Empty with confidence 0.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// Thread-safe as long as every stage's process() is (the bundled stages are).
  [[nodiscard]] PageResult run(const Page& page,
                               std::stop_token stop = {},
                               StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace labscan::core

#include <labscan/core/pipeline.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <utility>

namespace labscan::core {

namespace {

PageResult exhausted(const PageContext& ctx, std::size_t page_index) {
  PageResult out;
  out.page_index = page_index;
  out.source = ExtractionSource::Empty;
  out.confidence = 0.0;
  if (!ctx.recognized_text.empty()) out.raw_text = ctx.recognized_text;
  return out;
}

}  // namespace

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

PageResult Pipeline::run(const Page& page,
                         std::stop_token stop,
                         StageTimingCallback* timing_cb) {
  PageContext current{&page, {}, stop};

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    if (stop.stop_requested()) {
      spdlog::info("page {}: cancelled before stage '{}'", page.index(), stages_[i]->name());
      break;
    }

    const auto stage_start = std::chrono::steady_clock::now();
    std::expected<StageOutput, PipelineError> result = std::unexpected(PipelineError::None);
    try {
      result = stages_[i]->process(current);
    } catch (const std::exception& e) {
      spdlog::error("page {}: stage '{}' threw: {}", page.index(), stages_[i]->name(), e.what());
    }
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-3 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::microseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!result) {
      if (result.error() != PipelineError::None) {
        spdlog::warn("page {}: stage '{}' failed: {}", page.index(), stages_[i]->name(),
                     to_string(result.error()));
      }
      continue;
    }

    if (auto* done = std::get_if<PageResult>(&*result)) {
      done->page_index = page.index();
      if (!done->raw_text && !current.recognized_text.empty()) {
        done->raw_text = current.recognized_text;
      }
      spdlog::debug("page {}: '{}' produced {} markers (confidence {:.2f})", page.index(),
                    stages_[i]->name(), done->markers.size(), done->confidence);
      return std::move(*done);
    }

    current = std::get<PageContext>(std::move(*result));
    current.page = &page;
    current.stop = stop;
  }

  spdlog::info("page {}: no markers extracted", page.index());
  return exhausted(current, page.index());
}

}  // namespace labscan::core

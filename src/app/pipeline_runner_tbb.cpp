#include <labscan/app/pipeline_runner_tbb.hpp>

#ifdef LABSCAN_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <exception>

namespace labscan::app {

std::vector<labscan::core::PageResult> extract_pages_tbb(
    labscan::core::Pipeline& pipeline,
    const std::vector<labscan::core::Page>& pages,
    std::stop_token stop) {
  std::vector<labscan::core::PageResult> results(pages.size());
  if (pages.empty()) return results;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, pages.size()),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          try {
            results[i] = pipeline.run(pages[i], stop);
          } catch (const std::exception& e) {
            spdlog::error("page {}: pipeline threw: {}", pages[i].index(), e.what());
            results[i] = labscan::core::PageResult{};
            results[i].page_index = pages[i].index();
          }
        }
      });
  return results;
}

}  // namespace labscan::app

#endif  // LABSCAN_HAS_TBB

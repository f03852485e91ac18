#include <labscan/app/pipeline_runner.hpp>
#include <labscan/app/aggregator.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <queue>
#include <thread>

namespace labscan::app {

namespace lc = labscan::core;

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

/// A page that throws becomes an empty result; the other pages still run.
lc::PageResult run_page(lc::Pipeline& pipeline, const lc::Page& page, const RunOptions& options) {
  try {
    return pipeline.run(page, options.stop, options.timing_cb);
  } catch (const std::exception& e) {
    spdlog::error("page {}: pipeline threw: {}", page.index(), e.what());
  }
  lc::PageResult empty;
  empty.page_index = page.index();
  return empty;
}

}  // namespace

std::vector<lc::PageResult> extract_pages(lc::Pipeline& pipeline,
                                          const std::vector<lc::Page>& pages,
                                          const RunOptions& options) {
  const std::size_t n = pages.size();
  std::vector<lc::PageResult> results(n);
  if (n == 0) return results;

  const std::size_t workers = std::min(effective_workers(options.page_workers), n);
  if (workers <= 1) {
    for (std::size_t i = 0; i < n; ++i) {
      results[i] = run_page(pipeline, pages[i], options);
    }
    return results;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  // Each worker owns the result slots of the indexes it pops, so writes never overlap.
  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      results[idx] = run_page(pipeline, pages[idx], options);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
  return results;
}

lc::ExtractionResult extract_document(const labscan::vision::DocumentDecoder& decoder,
                                      lc::Pipeline& pipeline,
                                      const lc::Document& document,
                                      const RunOptions& options) {
  std::expected<std::vector<lc::Page>, lc::PipelineError> pages =
      std::unexpected(lc::PipelineError::DecodeFailed);
  try {
    pages = decoder.decode(document);
  } catch (const std::exception& e) {
    spdlog::error("{}: decoder threw: {}", document.filename, e.what());
  }
  if (!pages) {
    spdlog::warn("{}: cannot decode document: {}", document.filename,
                 lc::to_string(pages.error()));
    return lc::ExtractionResult{};
  }

  spdlog::info("{}: {} page(s), {} worker(s)", document.filename, pages->size(),
               options.page_workers);
  auto result = aggregate(extract_pages(pipeline, *pages, options));
  spdlog::info("{}: {} markers, confidence {:.2f}", document.filename, result.markers.size(),
               result.confidence);
  return result;
}

}  // namespace labscan::app

#include <labscan/app/aggregator.hpp>
#include <labscan/core/alias_table.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <utility>

namespace labscan::app {

namespace lc = labscan::core;

lc::ExtractionResult aggregate(std::vector<lc::PageResult> pages) {
  std::stable_sort(pages.begin(), pages.end(),
                   [](const lc::PageResult& a, const lc::PageResult& b) {
                     return a.page_index < b.page_index;
                   });

  lc::ExtractionResult out;
  out.page_count = pages.size();

  std::unordered_map<std::string, std::size_t> position;
  std::string text;
  double confidence_sum = 0.0;
  const bool paginated = pages.size() > 1;

  for (auto& page : pages) {
    for (auto& marker : page.markers) {
      const auto [it, inserted] = position.try_emplace(lc::to_lower(marker.name), out.markers.size());
      if (inserted) {
        out.markers.push_back(std::move(marker));
      } else {
        out.markers[it->second] = std::move(marker);
      }
    }

    if (page.raw_text && !page.raw_text->empty()) {
      if (!text.empty()) text += "\n\n";
      if (paginated) {
        text += "--- Page " + std::to_string(page.page_index + 1) + " ---\n";
      }
      text += *page.raw_text;
    }
    confidence_sum += page.confidence;
  }

  if (!text.empty()) out.raw_text = std::move(text);
  if (!pages.empty()) {
    const double mean = std::clamp(confidence_sum / static_cast<double>(pages.size()), 0.0, 1.0);
    out.confidence = std::round(mean * 100.0) / 100.0;
  }
  return out;
}

}  // namespace labscan::app

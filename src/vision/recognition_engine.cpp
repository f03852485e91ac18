#include <labscan/vision/recognition_engine.hpp>

namespace labscan::vision {

std::string_view to_string(LayoutMode mode) noexcept {
  switch (mode) {
    case LayoutMode::AutoSegment:
      return "auto";
    case LayoutMode::SingleBlock:
      return "single_block";
    case LayoutMode::SingleColumn:
      return "single_column";
  }
  return "unknown";
}

}  // namespace labscan::vision

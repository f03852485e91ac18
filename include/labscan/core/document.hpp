#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace labscan::core {

/// Uploaded input: raw bytes plus the metadata the caller received with them.
/// Created per request and treated as read-only by the pipeline.
struct Document {
  std::vector<std::byte> bytes;
  std::string filename;
  std::string content_type;  // declared MIME type, may be empty
};

}  // namespace labscan::core

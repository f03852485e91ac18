#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace labscan::core {

/// Standard (RFC 4648) base64 with padding, no line breaks.
[[nodiscard]] std::string base64_encode(std::span<const std::byte> bytes);

/// Decode standard base64. Whitespace is ignored; returns nullopt on invalid input.
[[nodiscard]] std::optional<std::vector<std::byte>> base64_decode(std::string_view text);

}  // namespace labscan::core

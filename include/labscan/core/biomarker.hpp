#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace labscan::core {

/// Abnormal-result flag printed next to a reading.
enum class AbnormalFlag : std::uint8_t {
  High,
  Low,
};

/// Single lab reading. value is always finite; entries that cannot produce a
/// finite value are dropped upstream, never defaulted.
struct Biomarker {
  std::string name;
  double value{0.0};
  std::string unit;
  std::optional<double> reference_low;
  std::optional<double> reference_high;
  std::optional<AbnormalFlag> flag;
};

/// "H" or "L".
[[nodiscard]] std::string_view flag_code(AbnormalFlag flag) noexcept;

/// Maps lab flag glyphs to a flag: H, HIGH, *, ↑, ABNORMAL HIGH -> High;
/// L, LOW, ↓, ABNORMAL LOW -> Low. Case-insensitive; anything else -> nullopt.
[[nodiscard]] std::optional<AbnormalFlag> parse_flag(std::string_view text);

}  // namespace labscan::core

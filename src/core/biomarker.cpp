#include <labscan/core/biomarker.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace labscan::core {

namespace {

std::string normalize_glyph(std::string_view text) {
  const auto start = text.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = text.find_last_not_of(" \t\r\n");
  std::string s(text.substr(start, end - start + 1));
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

}  // namespace

std::string_view flag_code(AbnormalFlag flag) noexcept {
  return flag == AbnormalFlag::High ? "H" : "L";
}

std::optional<AbnormalFlag> parse_flag(std::string_view text) {
  const std::string s = normalize_glyph(text);
  if (s.empty()) return std::nullopt;

  if (s == "H" || s == "HIGH" || s == "*" || s == "\xE2\x86\x91" || s == "HH" ||
      s == "ABNORMAL HIGH") {
    return AbnormalFlag::High;
  }
  if (s == "L" || s == "LOW" || s == "\xE2\x86\x93" || s == "LL" ||
      s == "ABNORMAL LOW") {
    return AbnormalFlag::Low;
  }
  return std::nullopt;
}

}  // namespace labscan::core

#include <labscan/extract/pattern_extractor.hpp>
#include <labscan/extract/marker_reply.hpp>
#include <spdlog/spdlog.h>
#include <optional>
#include <string>
#include <unordered_set>

namespace labscan::extract {

namespace lc = labscan::core;

namespace {

// Capture groups: 1 name, 2 value, 3 unit, 4 range low, 5 range high.
constexpr const char* kValueLinePattern =
    R"(([A-Za-z][A-Za-z0-9\s\-\(\)]+?)\s+(\d+\.?\d*)\s*([a-zA-Z/%]+(?:/[a-zA-Z]+)?)?)"
    R"((?:\s*[\[\(]?\s*(\d+\.?\d*)\s*(?:-|–)\s*(\d+\.?\d*)\s*[\]\)]?)?)";

// Capture groups: 1 name, 2 value, 3 unit.
constexpr const char* kColonLinePattern =
    R"(([A-Za-z][A-Za-z0-9\s\-]+?):\s*(\d+\.?\d*)\s*([a-zA-Z/%]+)?)";

constexpr std::string_view kKnownTokens[] = {
    "glucose",  "hdl",      "ldl",          "cholesterol", "triglycerides", "hemoglobin",
    "hematocrit", "wbc",    "rbc",          "platelets",   "creatinine",    "bun",
    "sodium",   "potassium", "chloride",    "calcium",     "albumin",       "protein",
    "bilirubin", "ast",     "alt",          "alp",         "ggt",           "tsh",
    "hba1c",    "a1c",      "insulin",      "ferritin",    "iron",          "vitamin d",
    "b12",      "testosterone", "estradiol", "cortisol",   "crp",           "homocysteine",
    "apob",     "lp(a)",    "egfr",         "mcv",         "mch",           "mchc",
    "rdw",      "mpv",      "uric acid",    "magnesium",   "zinc",          "folate",
    "dhea",     "vldl",     "fibrinogen",
};

std::optional<double> group_number(const std::smatch& m, std::size_t group) {
  if (!m[group].matched) return std::nullopt;
  return parse_decimal(m[group].str());
}

}  // namespace

PatternExtractor::PatternExtractor(const lc::AliasTable& aliases)
    : aliases_(&aliases),
      value_line_(kValueLinePattern, std::regex::ECMAScript | std::regex::icase),
      colon_line_(kColonLinePattern, std::regex::ECMAScript | std::regex::icase) {}

bool PatternExtractor::is_known_marker_name(std::string_view name) {
  const std::string lower = lc::to_lower(name);
  for (const auto token : kKnownTokens) {
    if (lower.find(token) != std::string::npos) return true;
  }
  return false;
}

std::vector<lc::Biomarker> PatternExtractor::extract(std::string_view raw_text) const {
  std::vector<lc::Biomarker> found;
  std::unordered_set<std::string> seen;

  std::size_t pos = 0;
  while (pos <= raw_text.size()) {
    auto eol = raw_text.find('\n', pos);
    if (eol == std::string_view::npos) eol = raw_text.size();
    const std::string line = lc::trim_copy(raw_text.substr(pos, eol - pos));
    pos = eol + 1;
    if (line.empty() || line.find_first_of("0123456789") == std::string::npos) continue;
    if (lc::utf8_length(line) > kMaxLineLength) {
      spdlog::debug("pattern fallback: skipping {}-byte line", line.size());
      continue;
    }

    for (const auto* pattern : {&value_line_, &colon_line_}) {
      std::smatch m;
      if (!std::regex_search(line, m, *pattern)) continue;

      const std::string name = lc::trim_copy(m[1].str());
      if (!is_known_marker_name(name) && name.size() < 3) continue;

      const auto value = group_number(m, 2);
      if (!value) continue;

      lc::Biomarker marker;
      marker.name = aliases_->normalize(name);
      marker.value = *value;
      marker.unit = m[3].matched ? m[3].str() : std::string();
      if (pattern == &value_line_) {
        marker.reference_low = group_number(m, 4);
        marker.reference_high = group_number(m, 5);
      }

      if (seen.insert(lc::to_lower(marker.name)).second) {
        found.push_back(std::move(marker));
      }
      break;
    }
  }

  if (!found.empty()) {
    spdlog::info("pattern fallback: {} markers", found.size());
  }
  return found;
}

}  // namespace labscan::extract

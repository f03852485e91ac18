#include <labscan/core/alias_table.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace labscan::core {

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string trim_copy(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n\f\v");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n\f\v");
  return std::string(s.substr(start, end - start + 1));
}

std::size_t utf8_length(std::string_view s) noexcept {
  return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char ch) {
    return (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
  }));
}

AliasTable::AliasTable(Map aliases) : aliases_(std::move(aliases)) {
  for (const auto& [alias, canonical] : aliases_) {
    if (alias.empty() || alias != to_lower(trim_copy(alias))) {
      throw std::invalid_argument("AliasTable: alias must be lowercase and trimmed: '" +
                                  alias + "'");
    }
    if (canonical.empty() || canonical != trim_copy(canonical)) {
      throw std::invalid_argument("AliasTable: canonical name must be trimmed: '" +
                                  canonical + "'");
    }
    const auto it = aliases_.find(to_lower(canonical));
    if (it != aliases_.end() && it->second != canonical) {
      throw std::invalid_argument("AliasTable: canonical name '" + canonical +
                                  "' re-maps to '" + it->second + "'");
    }
  }
}

std::string AliasTable::normalize(std::string_view name) const {
  std::string trimmed = trim_copy(name);
  const auto it = aliases_.find(to_lower(trimmed));
  if (it != aliases_.end()) return it->second;
  return trimmed;
}

bool AliasTable::contains(std::string_view alias) const {
  return aliases_.find(to_lower(trim_copy(alias))) != aliases_.end();
}

const AliasTable& AliasTable::builtin() {
  static const AliasTable table(Map{
      // Hematology
      {"wbc", "White Blood Cells"},
      {"white blood cells", "White Blood Cells"},
      {"rbc", "Red Blood Cells"},
      {"red blood cells", "Red Blood Cells"},
      {"hgb", "Hemoglobin"},
      {"hb", "Hemoglobin"},
      {"hemoglobin", "Hemoglobin"},
      {"hct", "Hematocrit"},
      {"hematocrit", "Hematocrit"},
      {"plt", "Platelets"},
      {"platelets", "Platelets"},
      {"mcv", "MCV"},
      {"mch", "MCH"},
      {"mchc", "MCHC"},
      {"rdw", "RDW"},
      {"mpv", "MPV"},
      // Metabolic panel
      {"glucose", "Glucose"},
      {"gluc", "Glucose"},
      {"fasting glucose", "Glucose (Fasting)"},
      {"bun", "BUN"},
      {"creatinine", "Creatinine"},
      {"creat", "Creatinine"},
      {"egfr", "eGFR"},
      {"sodium", "Sodium"},
      {"na", "Sodium"},
      {"potassium", "Potassium"},
      {"k", "Potassium"},
      {"chloride", "Chloride"},
      {"cl", "Chloride"},
      {"co2", "CO2"},
      {"carbon dioxide", "CO2"},
      {"calcium", "Calcium"},
      {"ca", "Calcium"},
      // Liver
      {"total protein", "Total Protein"},
      {"albumin", "Albumin"},
      {"alb", "Albumin"},
      {"globulin", "Globulin"},
      {"a/g ratio", "A/G Ratio"},
      {"bilirubin", "Bilirubin Total"},
      {"total bilirubin", "Bilirubin Total"},
      {"direct bilirubin", "Bilirubin Direct"},
      {"alkaline phosphatase", "Alkaline Phosphatase"},
      {"alk phos", "Alkaline Phosphatase"},
      {"alp", "Alkaline Phosphatase"},
      {"ast", "AST"},
      {"sgot", "AST"},
      {"alt", "ALT"},
      {"sgpt", "ALT"},
      {"ggt", "GGT"},
      {"ldh", "LDH"},
      // Lipids
      {"cholesterol", "Total Cholesterol"},
      {"total cholesterol", "Total Cholesterol"},
      {"hdl", "HDL Cholesterol"},
      {"hdl-c", "HDL Cholesterol"},
      {"hdl cholesterol", "HDL Cholesterol"},
      {"ldl", "LDL Cholesterol"},
      {"ldl-c", "LDL Cholesterol"},
      {"ldl cholesterol", "LDL Cholesterol"},
      {"triglycerides", "Triglycerides"},
      {"trig", "Triglycerides"},
      {"vldl", "VLDL"},
      {"apob", "ApoB"},
      {"apo b", "ApoB"},
      {"apolipoprotein b", "ApoB"},
      {"lp(a)", "Lp(a)"},
      {"lipoprotein(a)", "Lp(a)"},
      {"lipoprotein a", "Lp(a)"},
      // Thyroid
      {"tsh", "TSH"},
      {"t3", "T3"},
      {"free t3", "Free T3"},
      {"ft3", "Free T3"},
      {"t4", "T4"},
      {"free t4", "Free T4"},
      {"ft4", "Free T4"},
      // Diabetes
      {"hemoglobin a1c", "HbA1c"},
      {"hba1c", "HbA1c"},
      {"a1c", "HbA1c"},
      {"glycated hemoglobin", "HbA1c"},
      {"insulin", "Insulin"},
      {"fasting insulin", "Insulin (Fasting)"},
      {"homa-ir", "HOMA-IR"},
      // Inflammation
      {"c-reactive protein", "CRP"},
      {"crp", "CRP"},
      {"hs-crp", "hs-CRP"},
      {"hscrp", "hs-CRP"},
      {"high sensitivity crp", "hs-CRP"},
      {"esr", "ESR"},
      {"homocysteine", "Homocysteine"},
      {"fibrinogen", "Fibrinogen"},
      {"d-dimer", "D-Dimer"},
      // Iron panel
      {"ferritin", "Ferritin"},
      {"iron", "Iron"},
      {"tibc", "TIBC"},
      {"transferrin saturation", "Transferrin Saturation"},
      // Vitamins and minerals
      {"vitamin d", "Vitamin D"},
      {"25-hydroxy vitamin d", "Vitamin D"},
      {"vitamin d, 25-oh", "Vitamin D"},
      {"vitamin b12", "Vitamin B12"},
      {"b12", "Vitamin B12"},
      {"folate", "Folate"},
      {"folic acid", "Folate"},
      {"magnesium", "Magnesium"},
      {"mg", "Magnesium"},
      {"zinc", "Zinc"},
      // Hormones
      {"testosterone", "Testosterone"},
      {"total testosterone", "Testosterone Total"},
      {"free testosterone", "Testosterone Free"},
      {"estradiol", "Estradiol"},
      {"e2", "Estradiol"},
      {"dhea-s", "DHEA-S"},
      {"dhea sulfate", "DHEA-S"},
      {"cortisol", "Cortisol"},
      {"psa", "PSA"},
      // Other
      {"uric acid", "Uric Acid"},
  });
  return table;
}

}  // namespace labscan::core

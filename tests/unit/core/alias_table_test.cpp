#include <labscan/core/alias_table.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

namespace lc = labscan::core;

TEST(AliasTable, BuiltinMapsCommonAbbreviations) {
  const auto& t = lc::AliasTable::builtin();
  EXPECT_EQ(t.normalize("a1c"), "HbA1c");
  EXPECT_EQ(t.normalize("HBA1C"), "HbA1c");
  EXPECT_EQ(t.normalize("  ldl-c "), "LDL Cholesterol");
  EXPECT_EQ(t.normalize("HDL"), "HDL Cholesterol");
  EXPECT_EQ(t.normalize("wbc"), "White Blood Cells");
}

TEST(AliasTable, UnknownNameIsTrimmedAndKeepsCase) {
  const auto& t = lc::AliasTable::builtin();
  EXPECT_EQ(t.normalize("  Omega-3 Index "), "Omega-3 Index");
  EXPECT_EQ(t.normalize(""), "");
}

TEST(AliasTable, NormalizeIsIdempotentForEveryEntry) {
  const auto& t = lc::AliasTable::builtin();
  for (const auto& [alias, canonical] : t.entries()) {
    const std::string once = t.normalize(alias);
    EXPECT_EQ(t.normalize(once), once) << alias;
  }
}

TEST(AliasTable, Contains) {
  const auto& t = lc::AliasTable::builtin();
  EXPECT_TRUE(t.contains("A1C"));
  EXPECT_FALSE(t.contains("not a marker"));
  EXPECT_GT(t.size(), 20u);
}

TEST(AliasTable, RejectsUppercaseKey) {
  EXPECT_THROW(lc::AliasTable(lc::AliasTable::Map{{"LDL", "LDL Cholesterol"}}), std::invalid_argument);
}

TEST(AliasTable, RejectsUntrimmedCanonical) {
  EXPECT_THROW(lc::AliasTable(lc::AliasTable::Map{{"ldl", " LDL Cholesterol"}}), std::invalid_argument);
}

TEST(AliasTable, RejectsCanonicalThatRemaps) {
  // "glucose" -> "Glucose", but "Glucose" lowercased maps somewhere else.
  EXPECT_THROW(lc::AliasTable({{"glu", "Glucose"}, {"glucose", "Fasting Glucose"}}),
               std::invalid_argument);
}

TEST(AliasTable, AcceptsConsistentTable) {
  const lc::AliasTable t({{"glu", "Glucose"}, {"glucose", "Glucose"}});
  EXPECT_EQ(t.normalize("GLU"), "Glucose");
  EXPECT_EQ(t.normalize("Glucose"), "Glucose");
}

TEST(StringHelpers, LowerTrimLength) {
  EXPECT_EQ(lc::to_lower("HbA1c"), "hba1c");
  EXPECT_EQ(lc::trim_copy("\t a b \n"), "a b");
  EXPECT_EQ(lc::utf8_length("abc"), 3u);
  EXPECT_EQ(lc::utf8_length("\xE2\x86\x91"), 1u);
}

#include <labscan/core/alias_table.hpp>
#include <labscan/extract/pattern_extractor.hpp>
#include <gtest/gtest.h>
#include <string>

namespace lc = labscan::core;
namespace le = labscan::extract;

TEST(PatternExtractor, ValueLineWithRange) {
  const le::PatternExtractor extractor(lc::AliasTable::builtin());
  const auto markers = extractor.extract("Glucose 95 mg/dL (70-100)");
  ASSERT_EQ(markers.size(), 1u);
  EXPECT_EQ(markers[0].name, "Glucose");
  EXPECT_DOUBLE_EQ(markers[0].value, 95.0);
  EXPECT_EQ(markers[0].unit, "mg/dL");
  EXPECT_EQ(markers[0].reference_low, 70.0);
  EXPECT_EQ(markers[0].reference_high, 100.0);
  EXPECT_FALSE(markers[0].flag.has_value());
}

TEST(PatternExtractor, EnDashRange) {
  const le::PatternExtractor extractor(lc::AliasTable::builtin());
  const auto markers = extractor.extract("Creatinine 0.9 mg/dL 0.6–1.2");
  ASSERT_EQ(markers.size(), 1u);
  EXPECT_EQ(markers[0].reference_low, 0.6);
  EXPECT_EQ(markers[0].reference_high, 1.2);
}

TEST(PatternExtractor, ColonLinesAndAliases) {
  const le::PatternExtractor extractor(lc::AliasTable::builtin());
  const auto markers = extractor.extract("HDL: 55 mg/dL\nLDL 130 mg/dL");
  ASSERT_EQ(markers.size(), 2u);
  EXPECT_EQ(markers[0].name, "HDL Cholesterol");
  EXPECT_DOUBLE_EQ(markers[0].value, 55.0);
  EXPECT_EQ(markers[0].unit, "mg/dL");
  EXPECT_FALSE(markers[0].reference_low.has_value());
  EXPECT_EQ(markers[1].name, "LDL Cholesterol");
  EXPECT_DOUBLE_EQ(markers[1].value, 130.0);
}

TEST(PatternExtractor, FirstOccurrenceWins) {
  const le::PatternExtractor extractor(lc::AliasTable::builtin());
  const auto markers = extractor.extract("Glucose 95 mg/dL\nglucose 140 mg/dL\nGLUC: 80");
  ASSERT_EQ(markers.size(), 1u);
  EXPECT_DOUBLE_EQ(markers[0].value, 95.0);
}

TEST(PatternExtractor, IgnoresHeadersAndShortUnknownNames) {
  const le::PatternExtractor extractor(lc::AliasTable::builtin());
  EXPECT_TRUE(extractor.extract("COMPREHENSIVE METABOLIC PANEL\n\n   \n").empty());
  EXPECT_TRUE(extractor.extract("Qx 12").empty());
  EXPECT_TRUE(extractor.extract("").empty());
}

TEST(PatternExtractor, MockReportText) {
  const le::PatternExtractor extractor(lc::AliasTable::builtin());
  const auto markers = extractor.extract(
      "COMPREHENSIVE METABOLIC PANEL\n"
      "Glucose 95 mg/dL (70-100)\n"
      "Creatinine 0.9 mg/dL (0.6-1.2)\n"
      "HDL: 55 mg/dL\n"
      "LDL 130 mg/dL (0-100)\n");
  ASSERT_EQ(markers.size(), 4u);
  EXPECT_EQ(markers[0].name, "Glucose");
  EXPECT_EQ(markers[1].name, "Creatinine");
  EXPECT_EQ(markers[2].name, "HDL Cholesterol");
  EXPECT_EQ(markers[3].name, "LDL Cholesterol");
  EXPECT_EQ(markers[3].reference_high, 100.0);
}

TEST(PatternExtractor, OverlongLineIsSkipped) {
  const le::PatternExtractor extractor(lc::AliasTable::builtin());
  const std::string line = std::string(100000, 'a') + " Glucose 5.4 mg/dL";
  EXPECT_TRUE(extractor.extract(line).empty());
}

TEST(PatternExtractor, LinesAroundOverlongLineStillParse) {
  const le::PatternExtractor extractor(lc::AliasTable::builtin());
  const std::string noise(le::PatternExtractor::kMaxLineLength + 1, 'x');
  const auto markers =
      extractor.extract("Glucose 95 mg/dL\n" + noise + " 7\nHDL: 55 mg/dL\n");
  ASSERT_EQ(markers.size(), 2u);
  EXPECT_EQ(markers[0].name, "Glucose");
  EXPECT_EQ(markers[1].name, "HDL Cholesterol");
}

TEST(PatternExtractor, LongDigitFreeTextIsIgnored) {
  const le::PatternExtractor extractor(lc::AliasTable::builtin());
  std::string text;
  for (int i = 0; i < 5000; ++i) text += "word ";
  EXPECT_TRUE(extractor.extract(text).empty());
}

TEST(PatternExtractor, KnownMarkerNames) {
  EXPECT_TRUE(le::PatternExtractor::is_known_marker_name("Vitamin D, 25-OH"));
  EXPECT_TRUE(le::PatternExtractor::is_known_marker_name("HbA1c"));
  EXPECT_TRUE(le::PatternExtractor::is_known_marker_name("Lp(a)"));
  EXPECT_FALSE(le::PatternExtractor::is_known_marker_name("Page"));
}

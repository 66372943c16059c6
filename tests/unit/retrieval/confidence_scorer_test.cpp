#include <gtest/gtest.h>

#include "docmind_core/retrieval/confidence_scorer.hpp"

namespace docmind_tests {

using docmind_core::ConfidenceScorer;

TEST(ConfidenceScorerTest, ShortAnswersScoreLow) {
  EXPECT_FLOAT_EQ(ConfidenceScorer::score(""), ConfidenceScorer::LOW);
  EXPECT_FLOAT_EQ(ConfidenceScorer::score(std::string(100, 'a')), ConfidenceScorer::LOW);
}

TEST(ConfidenceScorerTest, LengthThresholdsAreExclusive) {
  EXPECT_FLOAT_EQ(ConfidenceScorer::score(std::string(101, 'a')), ConfidenceScorer::MEDIUM);
  // Long but without any marker keyword
  EXPECT_FLOAT_EQ(ConfidenceScorer::score(std::string(300, 'a')), ConfidenceScorer::MEDIUM);
  EXPECT_FLOAT_EQ(ConfidenceScorer::score(std::string(192, 'a') + "document"),
                  ConfidenceScorer::MEDIUM);
  EXPECT_FLOAT_EQ(ConfidenceScorer::score(std::string(193, 'a') + "document"),
                  ConfidenceScorer::HIGH);
}

TEST(ConfidenceScorerTest, KeywordsAreCaseInsensitive) {
  const std::string padding(250, 'x');
  EXPECT_FLOAT_EQ(ConfidenceScorer::score(padding + " Based On"), ConfidenceScorer::HIGH);
  EXPECT_FLOAT_EQ(ConfidenceScorer::score(padding + " ANALYSIS"), ConfidenceScorer::HIGH);
  EXPECT_FLOAT_EQ(ConfidenceScorer::score(padding + " Context"), ConfidenceScorer::HIGH);
}

TEST(ConfidenceScorerTest, LongFormattedAnswersScoreVeryHigh) {
  EXPECT_FLOAT_EQ(ConfidenceScorer::score(std::string(501, 'a') + "**"),
                  ConfidenceScorer::VERY_HIGH);
  // "**" alone is not enough below 500 code points
  EXPECT_FLOAT_EQ(ConfidenceScorer::score(std::string(400, 'a') + "**"), ConfidenceScorer::MEDIUM);
}

TEST(ConfidenceScorerTest, LengthIsCountedInCodePoints) {
  // 150 two-byte characters are 300 bytes but only 150 code points
  std::string text;
  for (int i = 0; i < 150; ++i) {
    text += "\xC3\xA9";
  }
  text += " document";
  EXPECT_FLOAT_EQ(ConfidenceScorer::score(text), ConfidenceScorer::MEDIUM);
}

TEST(ConfidenceScorerTest, AddingMarkersNeverLowersTheScore) {
  std::string answer = std::string(600, 'a');
  const float plain = ConfidenceScorer::score(answer);
  const float with_keyword = ConfidenceScorer::score(answer + " analysis");
  const float with_bold = ConfidenceScorer::score(answer + " analysis **");

  EXPECT_LE(plain, with_keyword);
  EXPECT_LE(with_keyword, with_bold);
  EXPECT_FLOAT_EQ(with_bold, ConfidenceScorer::VERY_HIGH);
}

}  // namespace docmind_tests

// =============================================================================
// Metrics Calculator Tests
// =============================================================================

#include <gtest/gtest.h>
#include "regmetrics/history/metrics_calculator.hpp"
#include <string>

using namespace regmetrics;
using namespace regmetrics::history;

class MetricsCalculatorTest : public ::testing::Test {
protected:
    static constexpr double kEps = 1e-9;
};

TEST_F(MetricsCalculatorTest, EmptyText) {
    MetricsRecord m = compute_metrics("", StructureCounts{}, 0, 0);

    EXPECT_EQ(m.word_count, 0u);
    EXPECT_EQ(m.sentence_count, 0u);
    EXPECT_EQ(m.paragraph_count, 0u);
    EXPECT_DOUBLE_EQ(m.average_sentence_length, 0.0);
    EXPECT_DOUBLE_EQ(m.average_word_length, 0.0);
    EXPECT_NEAR(m.language_complexity_score, 0.1, kEps);
    EXPECT_NEAR(m.readability_score, 100.0, kEps);
    EXPECT_NEAR(m.simplicity_score, 0.46, kEps);
}

TEST_F(MetricsCalculatorTest, Syllables) {
    EXPECT_EQ(count_syllables("cat"), 1u);
    EXPECT_EQ(count_syllables("the"), 1u);
    EXPECT_EQ(count_syllables("regulation"), 4u);
    EXPECT_EQ(count_syllables("Agency"), 3u);
    EXPECT_EQ(count_syllables(""), 1u);
}

TEST_F(MetricsCalculatorTest, SentencesSkipAbbreviations) {
    EXPECT_EQ(count_sentences("See 5 U.S.C. 552 for details. Use forms, e.g. Form A. Done!"), 3u);
    EXPECT_EQ(count_sentences("Is it due? Yes."), 2u);
    EXPECT_EQ(count_sentences("He said \"stop.\" Then left."), 2u);
    EXPECT_EQ(count_sentences("Filed (i.e. received) late."), 1u);
    EXPECT_EQ(count_sentences("no terminator here"), 1u);
    EXPECT_EQ(count_sentences("Ends here. trailing words"), 2u);
    EXPECT_EQ(count_sentences("... !"), 0u);
    EXPECT_EQ(count_sentences(""), 0u);
}

TEST_F(MetricsCalculatorTest, Paragraphs) {
    EXPECT_EQ(count_paragraphs("a\n\nb\n \nc"), 3u);
    EXPECT_EQ(count_paragraphs("one line\nsame paragraph"), 1u);
    EXPECT_EQ(count_paragraphs("\n\n"), 0u);
    EXPECT_EQ(count_paragraphs(""), 0u);
}

TEST_F(MetricsCalculatorTest, SimpleSentences) {
    MetricsRecord m = compute_metrics("The cat sat. The dog ran.", StructureCounts{}, 0, 0);

    EXPECT_EQ(m.word_count, 6u);
    EXPECT_EQ(m.sentence_count, 2u);
    EXPECT_EQ(m.paragraph_count, 1u);
    EXPECT_DOUBLE_EQ(m.average_sentence_length, 3.0);
    EXPECT_DOUBLE_EQ(m.average_word_length, 3.0);
    EXPECT_NEAR(m.language_complexity_score, 0.1, kEps);
    EXPECT_NEAR(m.readability_score, 100.0, kEps);
    EXPECT_NEAR(m.simplicity_score, 1.0, kEps);
    EXPECT_DOUBLE_EQ(m.flesch_reading_ease, 100.0);
}

TEST_F(MetricsCalculatorTest, DenseTextScoresHigherComplexity) {
    const std::string simple = "The cat sat. The dog ran. We all went home.";
    const std::string dense =
        "Notwithstanding any contrary administrative determination, the responsible "
        "implementing organization shall comprehensively substantiate environmental "
        "characterizations, jurisdictional classifications, and intergovernmental "
        "coordination requirements before authorization of supplementary appropriations.";

    MetricsRecord a = compute_metrics(simple, StructureCounts{}, 0, 0);
    MetricsRecord b = compute_metrics(dense, StructureCounts{}, 0, 0);

    EXPECT_GT(b.language_complexity_score, a.language_complexity_score);
    EXPECT_LT(b.readability_score, a.readability_score);
    EXPECT_LT(b.simplicity_score, a.simplicity_score);
    EXPECT_GT(b.average_word_length, a.average_word_length);

    for (const MetricsRecord& m : {a, b}) {
        EXPECT_GE(m.language_complexity_score, 0.1);
        EXPECT_LE(m.language_complexity_score, 1.0);
        EXPECT_GE(m.readability_score, 30.0);
        EXPECT_LE(m.readability_score, 100.0);
        EXPECT_GE(m.simplicity_score, 0.1);
        EXPECT_LE(m.simplicity_score, 1.0);
        EXPECT_GE(m.flesch_reading_ease, 0.0);
        EXPECT_LE(m.flesch_reading_ease, 100.0);
        EXPECT_GE(m.automated_readability_index, 0.0);
        EXPECT_LE(m.automated_readability_index, 100.0);
    }
}

TEST_F(MetricsCalculatorTest, ReadabilityMapping) {
    EXPECT_NEAR(readability_score(0.1), 100.0, kEps);
    EXPECT_NEAR(readability_score(1.0), 30.0, kEps);
    EXPECT_NEAR(readability_score(0.55), 65.0, kEps);
    // Out-of-range complexity is clamped
    EXPECT_NEAR(readability_score(5.0), 30.0, kEps);
}

TEST_F(MetricsCalculatorTest, SmogNeedsThirtySentences) {
    TextStatistics stats = analyze_text("Regulatory authorization is necessary. It applies.");
    EXPECT_LT(stats.sentence_count, 30u);
    EXPECT_DOUBLE_EQ(smog_index(stats), 0.0);

    std::string long_text;
    for (int i = 0; i < 30; ++i) long_text += "Administrative regulation applies. ";
    TextStatistics many = analyze_text(long_text);
    EXPECT_EQ(many.sentence_count, 30u);
    EXPECT_GT(smog_index(many), 0.0);
    EXPECT_LE(smog_index(many), 100.0);
}

TEST_F(MetricsCalculatorTest, WordShapeCounts) {
    TextStatistics stats = analyze_text("(a) Administrative determination of fees.");

    EXPECT_EQ(stats.word_count, 5u);
    EXPECT_EQ(stats.lexical_words, 5u);
    EXPECT_EQ(stats.long_words, 2u);
    EXPECT_EQ(stats.short_words, 3u);
    EXPECT_DOUBLE_EQ(stats.long_word_ratio(), 0.4);
    EXPECT_EQ(stats.characters, 37u);
}

TEST_F(MetricsCalculatorTest, StructureAndAuthorsPassThrough) {
    MetricsRecord m = compute_metrics("Text.", StructureCounts{3, 1}, 5, 2);
    EXPECT_EQ(m.section_count, 3u);
    EXPECT_EQ(m.subpart_count, 1u);
    EXPECT_EQ(m.total_authors, 5u);
    EXPECT_EQ(m.revision_authors, 2u);
    EXPECT_TRUE(m.document_id.empty());
    EXPECT_TRUE(m.content_snapshot.empty());
}

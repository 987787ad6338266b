/**
 * @file metrics_calculator.hpp
 * @brief Surface text statistics and complexity/readability scores
 *
 * Everything here is a pure function of its inputs. Scores:
 *
 *   S = clamp((avg_sentence_length - 5) / 35)
 *   W = clamp((avg_word_length - 3) / 5)
 *   L = clamp(long_word_ratio / 0.5)                  long word: >= 7 code points
 *
 *   language_complexity = 0.1 + 0.9 * (0.40*S + 0.35*W + 0.25*L)      [0.1, 1.0]
 *   readability         = 100 - 70 * (complexity - 0.1) / 0.9          [30, 100]
 *   simplicity          = 0.1 + 0.9 * (0.40*(1-S) + 0.30*short_ratio
 *                                      + 0.30*flesch/100)             [0.1, 1.0]
 *                                                     short word: <= 4 code points
 *
 * Flesch reading ease, SMOG and ARI are normalized to 0..100, higher = easier.
 */

#pragma once

#include <cstddef>
#include <string_view>

#include "regmetrics/types.hpp"

namespace regmetrics::history {

struct TextStatistics {
    size_t word_count = 0;       // whitespace-delimited tokens
    size_t sentence_count = 0;
    size_t paragraph_count = 0;

    size_t lexical_words = 0;    // tokens with letters or digits left after trimming punctuation
    size_t long_words = 0;
    size_t short_words = 0;
    size_t complex_words = 0;    // >= 3 syllables
    size_t syllables = 0;
    size_t characters = 0;       // non-whitespace code points
    size_t word_length_total = 0;

    double average_sentence_length() const;
    double average_word_length() const;
    double long_word_ratio() const;
    double short_word_ratio() const;
};

struct StructureCounts {
    size_t sections = 0;
    size_t subparts = 0;
};

TextStatistics analyze_text(std::string_view text);

// Vowel-group heuristic: trailing 'e' dropped, at least one syllable
size_t count_syllables(std::string_view word);

// Terminal punctuation boundaries minus known abbreviations; trailing text
// without a terminator counts as one more sentence.
size_t count_sentences(std::string_view text);

// Non-empty blocks separated by blank lines
size_t count_paragraphs(std::string_view text);

double flesch_reading_ease(const TextStatistics& stats);
double smog_index(const TextStatistics& stats);           // 0 below 30 sentences
double automated_readability_index(const TextStatistics& stats);

double language_complexity_score(const TextStatistics& stats);
double readability_score(double complexity);
double simplicity_score(const TextStatistics& stats);

/**
 * @brief Fill a MetricsRecord for one version's body text
 *
 * document_id, metrics_date and content_snapshot are left for the caller.
 */
MetricsRecord compute_metrics(std::string_view text,
                              const StructureCounts& structure,
                              size_t accumulated_authors,
                              size_t revision_authors);

} // namespace regmetrics::history

#include "regmetrics/history/metrics_calculator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <string>
#include <vector>

#include "regmetrics/util/text.hpp"
#include "regmetrics/util/utf8.hpp"

namespace regmetrics::history {

namespace {

constexpr size_t kLongWordChars = 7;
constexpr size_t kShortWordChars = 4;
constexpr size_t kSmogMinSentences = 30;

double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

double clamp100(double v) {
    return std::max(0.0, std::min(100.0, v));
}

bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c >= 0x80;
}

// Token with surrounding ASCII punctuation removed ("(a)" -> "a", "rule." -> "rule")
std::string_view word_core(std::string_view token) {
    size_t begin = 0;
    size_t end = token.size();
    while (begin < end && !is_word_byte(static_cast<unsigned char>(token[begin]))) ++begin;
    while (end > begin && !is_word_byte(static_cast<unsigned char>(token[end - 1]))) --end;
    return token.substr(begin, end - begin);
}

// Closing quotes and brackets that may follow a terminator: ." .) .’ .”
std::string_view strip_closers(std::string_view token) {
    static constexpr std::string_view kRightSingle = "\xE2\x80\x99";
    static constexpr std::string_view kRightDouble = "\xE2\x80\x9D";
    for (;;) {
        if (token.empty()) return token;
        char c = token.back();
        if (c == '"' || c == '\'' || c == ')' || c == ']' || c == '}') {
            token.remove_suffix(1);
        } else if (token.size() >= 3 &&
                   (token.substr(token.size() - 3) == kRightSingle ||
                    token.substr(token.size() - 3) == kRightDouble)) {
            token.remove_suffix(3);
        } else {
            return token;
        }
    }
}

bool is_abbreviation(std::string_view token) {
    static constexpr std::array<std::string_view, 36> kAbbreviations = {
        "U.S.C.", "U.S.", "NO.", "NOS.", "E.G.", "I.E.", "AL.", "SEC.", "PT.", "FED.",
        "REG.", "INC.", "CO.", "CORP.", "MR.", "MRS.", "MS.", "DR.", "ST.", "VS.",
        "CF.", "APPROX.", "JAN.", "FEB.", "MAR.", "APR.", "JUN.", "JUL.", "AUG.", "SEP.",
        "SEPT.", "OCT.", "NOV.", "DEC.", "ETC.", "ET."
    };
    // Leading brackets do not change the abbreviation: "(e.g."
    while (!token.empty() && (token.front() == '(' || token.front() == '[' ||
                              token.front() == '"')) {
        token.remove_prefix(1);
    }
    std::string upper = util::to_upper_ascii(token);
    return std::find(kAbbreviations.begin(), kAbbreviations.end(), upper) != kAbbreviations.end();
}

bool is_blank_line(std::string_view line) {
    return util::trim(line).empty();
}

} // namespace

// =============================================================================
// TextStatistics
// =============================================================================

double TextStatistics::average_sentence_length() const {
    return static_cast<double>(word_count) / std::max<size_t>(sentence_count, 1);
}

double TextStatistics::average_word_length() const {
    return lexical_words ? static_cast<double>(word_length_total) / lexical_words : 0.0;
}

double TextStatistics::long_word_ratio() const {
    return lexical_words ? static_cast<double>(long_words) / lexical_words : 0.0;
}

double TextStatistics::short_word_ratio() const {
    return lexical_words ? static_cast<double>(short_words) / lexical_words : 0.0;
}

size_t count_syllables(std::string_view word) {
    std::string w = util::trim(word);
    for (char& c : w) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (w.empty()) return 1;
    if (w.back() == 'e') w.pop_back();

    auto is_vowel = [](char c) {
        return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u' || c == 'y';
    };
    size_t count = 0;
    for (size_t i = 0; i < w.size(); ++i) {
        if (is_vowel(w[i]) && (i == 0 || !is_vowel(w[i - 1]))) ++count;
    }
    return std::max<size_t>(1, count);
}

size_t count_sentences(std::string_view text) {
    std::vector<std::string> tokens = util::split_whitespace(text);
    size_t sentences = 0;
    bool open = false;  // words seen since the last boundary

    for (const auto& token : tokens) {
        open = open || !word_core(token).empty();
        std::string_view body = strip_closers(token);
        if (body.empty()) continue;

        char last = body.back();
        bool boundary = false;
        if (last == '!' || last == '?') {
            boundary = true;
        } else if (last == '.') {
            boundary = !is_abbreviation(body);
        }
        if (boundary && open) {
            ++sentences;
            open = false;
        }
    }
    if (open) ++sentences;
    return sentences;
}

size_t count_paragraphs(std::string_view text) {
    size_t paragraphs = 0;
    bool in_paragraph = false;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) eol = text.size();
        if (is_blank_line(text.substr(pos, eol - pos))) {
            in_paragraph = false;
        } else if (!in_paragraph) {
            in_paragraph = true;
            ++paragraphs;
        }
        pos = eol + 1;
    }
    return paragraphs;
}

TextStatistics analyze_text(std::string_view text) {
    TextStatistics stats;
    std::vector<std::string> tokens = util::split_whitespace(text);
    stats.word_count = tokens.size();

    for (const auto& token : tokens) {
        stats.characters += util::codepoint_count(token);
        std::string_view core = word_core(token);
        if (core.empty()) continue;

        size_t len = util::codepoint_count(core);
        ++stats.lexical_words;
        stats.word_length_total += len;
        if (len >= kLongWordChars) ++stats.long_words;
        if (len <= kShortWordChars) ++stats.short_words;

        size_t syl = count_syllables(core);
        stats.syllables += syl;
        if (syl >= 3) ++stats.complex_words;
    }

    stats.sentence_count = count_sentences(text);
    stats.paragraph_count = count_paragraphs(text);
    return stats;
}

// =============================================================================
// Scores
// =============================================================================

double flesch_reading_ease(const TextStatistics& stats) {
    if (stats.lexical_words == 0 || stats.sentence_count == 0) return 0.0;
    double wps = static_cast<double>(stats.lexical_words) / stats.sentence_count;
    double spw = static_cast<double>(stats.syllables) / stats.lexical_words;
    return clamp100(206.835 - 1.015 * wps - 84.6 * spw);
}

double smog_index(const TextStatistics& stats) {
    if (stats.sentence_count < kSmogMinSentences || stats.lexical_words == 0) return 0.0;
    double grade = 1.0430 * std::sqrt(stats.complex_words * (30.0 / stats.sentence_count)) + 3.1291;
    return clamp100(100.0 - (grade - 6.0) * (100.0 / 14.0));
}

double automated_readability_index(const TextStatistics& stats) {
    if (stats.lexical_words == 0 || stats.sentence_count == 0) return 0.0;
    double grade = 4.71 * (static_cast<double>(stats.characters) / stats.lexical_words) +
                   0.5 * (static_cast<double>(stats.lexical_words) / stats.sentence_count) - 21.43;
    return clamp100(100.0 - (grade - 1.0) * (100.0 / 13.0));
}

double language_complexity_score(const TextStatistics& stats) {
    double s = clamp01((stats.average_sentence_length() - 5.0) / 35.0);
    double w = clamp01((stats.average_word_length() - 3.0) / 5.0);
    double l = clamp01(stats.long_word_ratio() / 0.5);
    return 0.1 + 0.9 * (0.40 * s + 0.35 * w + 0.25 * l);
}

double readability_score(double complexity) {
    double c = std::max(0.1, std::min(1.0, complexity));
    return 100.0 - 70.0 * (c - 0.1) / 0.9;
}

double simplicity_score(const TextStatistics& stats) {
    double s = clamp01((stats.average_sentence_length() - 5.0) / 35.0);
    double flesch = flesch_reading_ease(stats) / 100.0;
    return 0.1 + 0.9 * (0.40 * (1.0 - s) + 0.30 * stats.short_word_ratio() + 0.30 * flesch);
}

MetricsRecord compute_metrics(std::string_view text,
                              const StructureCounts& structure,
                              size_t accumulated_authors,
                              size_t revision_authors) {
    TextStatistics stats = analyze_text(text);

    MetricsRecord m;
    m.word_count = stats.word_count;
    m.sentence_count = stats.sentence_count;
    m.paragraph_count = stats.paragraph_count;
    m.section_count = structure.sections;
    m.subpart_count = structure.subparts;
    m.total_authors = accumulated_authors;
    m.revision_authors = revision_authors;

    m.average_sentence_length = stats.average_sentence_length();
    m.average_word_length = stats.average_word_length();
    m.language_complexity_score = language_complexity_score(stats);
    m.readability_score = readability_score(m.language_complexity_score);
    m.simplicity_score = simplicity_score(stats);

    m.flesch_reading_ease = flesch_reading_ease(stats);
    m.smog_index = smog_index(stats);
    m.automated_readability_index = automated_readability_index(stats);
    return m;
}

} // namespace regmetrics::history

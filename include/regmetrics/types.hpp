// =============================================================================
// types.hpp - Records shared by the store and the history engine
// =============================================================================

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "regmetrics/util/text.hpp"

namespace regmetrics {

// =============================================================================
// Store records
// =============================================================================

struct SectionRecord {
    std::string year;
    std::string title_number;
    std::string part_number;
    std::string part_title;
    std::string section_number;
    std::string section_title;
    std::string content;         // body text only, paragraphs separated by "\n\n"
    bool content_empty = false;  // true for sections with no body text ("Reserved")

    bool operator==(const SectionRecord& other) const {
        return year == other.year && title_number == other.title_number &&
               part_number == other.part_number && part_title == other.part_title &&
               section_number == other.section_number &&
               section_title == other.section_title && content == other.content &&
               content_empty == other.content_empty;
    }
    bool operator!=(const SectionRecord& other) const { return !(*this == other); }
};

struct PartContainer {
    std::string part_number;
    std::string part_title;
    std::map<std::string, SectionRecord, util::NumberingLess> sections;
};

struct TitleFile {
    std::string year;
    std::string title_number;
    std::string volume;                // first merged volume
    std::vector<std::string> volumes;  // every merged volume, ascending
    std::map<std::string, PartContainer, util::NumberingLess> parts;

    size_t section_count() const {
        size_t n = 0;
        for (const auto& [num, part] : parts) n += part.sections.size();
        return n;
    }
};

// =============================================================================
// History records
// =============================================================================

struct VersionRecord {
    std::string document_id;
    std::string version_date;                 // YYYY-MM-DD
    std::optional<std::string> raw_text;      // absent = missing version
    std::set<std::string> revision_author_ids;
};

// Newest-first list as produced by the version-listing collaborator
struct DocumentHistory {
    std::string document_id;
    std::vector<VersionRecord> versions;
};

struct MetricsRecord {
    std::string document_id;
    std::string metrics_date;

    size_t word_count = 0;
    size_t sentence_count = 0;
    size_t paragraph_count = 0;
    size_t section_count = 0;
    size_t subpart_count = 0;

    size_t total_authors = 0;
    size_t revision_authors = 0;

    double language_complexity_score = 0.1;
    double readability_score = 100.0;
    double average_sentence_length = 0.0;
    double average_word_length = 0.0;
    double simplicity_score = 0.1;

    // Classic indices, each normalized to 0..100 (higher = easier)
    double flesch_reading_ease = 0.0;
    double smog_index = 0.0;
    double automated_readability_index = 0.0;

    std::string content_snapshot;
};

} // namespace regmetrics

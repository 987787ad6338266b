/**
 * @file record_builder.hpp
 * @brief Canonical Record Builder: structural tree -> SectionRecords -> TitleFile
 */

#pragma once

#include <string>
#include <vector>

#include "regmetrics/markup/hierarchy.hpp"
#include "regmetrics/types.hpp"

namespace regmetrics::markup {

/**
 * @brief One SectionRecord per SECTION node, in document order
 *
 * Sections with no extracted text are still emitted with content_empty set.
 * A section's part is its nearest PART ancestor; an unnumbered section is
 * keyed "unknown".
 */
std::vector<SectionRecord> build_section_records(const HierarchyNode& root,
                                                 const std::string& year,
                                                 const std::string& title_number);

struct AssembleStats {
    size_t added = 0;
    size_t duplicates = 0;  // key already present from an earlier volume; dropped
    size_t replaced = 0;    // key repeated within this volume; later one kept
};

/**
 * @brief Merge records of one source volume into a TitleFile
 *
 * Within one volume a repeated (part, section) key replaces the earlier
 * record. Across volumes the first volume to supply a key wins and later
 * duplicates are dropped. Both cases are logged. `volume` is appended to
 * title.volumes.
 */
AssembleStats merge_into_title_file(TitleFile& title,
                                    const std::vector<SectionRecord>& records,
                                    const std::string& volume);

TitleFile assemble_title_file(const std::vector<SectionRecord>& records,
                              const std::string& year,
                              const std::string& title_number,
                              const std::string& volume);

} // namespace regmetrics::markup

/**
 * @file version_listing.hpp
 * @brief Load newest-first version listings from JSON
 *
 *   {"document_id": "doc-1",
 *    "versions": [{"version_date": "2023-01-01", "authors": ["A"], "raw_text": "..."},
 *                 {"version_date": "2022-06-30", "authors": [], "file": "v2.xml"}]}
 *
 * A top-level array of such objects is accepted as well. "file" is resolved
 * against the listing's directory; an entry with neither text nor a readable
 * file becomes a missing version. Entry order is kept as given.
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "regmetrics/types.hpp"

namespace regmetrics::history {

// Throws ParseError on invalid JSON or a document without "document_id"
std::vector<DocumentHistory> parse_version_listing(std::string_view json_text,
                                                   const std::filesystem::path& base_dir,
                                                   const std::string& origin = "<memory>");

struct ListingLoadResult {
    std::vector<DocumentHistory> histories;
    std::vector<std::string> errors;  // one per listing file that could not be loaded
};

// `path` is a listing file or a directory scanned recursively for *.json
ListingLoadResult load_version_listings(const std::filesystem::path& path);

} // namespace regmetrics::history

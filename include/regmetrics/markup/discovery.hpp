/**
 * @file discovery.hpp
 * @brief Find bulk markup files (CFR-<year>-title<n>-vol<m>*.xml) under an input tree
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace regmetrics::markup {

struct MarkupSource {
    std::filesystem::path path;
    std::string year;
    std::string title_number;
    std::string volume;
};

// Parses year/title/volume out of a bulk file name; nullopt if it does not match
std::optional<MarkupSource> parse_source_name(const std::filesystem::path& path);

struct DiscoveryResult {
    std::vector<MarkupSource> sources;              // sorted by year, title, volume, path
    std::vector<std::filesystem::path> ignored;     // .xml files with unrecognized names
};

// Recursive scan. A missing root yields an empty result and a warning.
DiscoveryResult discover_sources(const std::filesystem::path& root);

} // namespace regmetrics::markup

// =============================================================================
// text.hpp - Whitespace, numbering and date helpers
// =============================================================================

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace regmetrics::util {

std::string trim(std::string_view s);

// Runs of whitespace (ASCII and U+00A0) become one space; result is trimmed.
std::string collapse_whitespace(std::string_view s);

// Whitespace-delimited tokens, same whitespace definition as collapse_whitespace
std::vector<std::string> split_whitespace(std::string_view s);

std::string to_upper_ascii(std::string_view s);

bool starts_with_ci(std::string_view s, std::string_view prefix);

// Strips a leading label ("§", "§§", "PART", "Pt.", "Subpart") from a
// structural number; the number itself is kept verbatim.
std::string strip_number_label(std::string_view raw);

// Natural ordering for dotted numbering: "1.2" < "1.10" < "2", digits
// before letters within a segment.
int compare_numbering(std::string_view a, std::string_view b);

struct NumberingLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return compare_numbering(a, b) < 0;
    }
};

// Strict YYYY-MM-DD with a plausible month/day
bool is_iso_date(std::string_view s);

} // namespace regmetrics::util

// =============================================================================
// codec.hpp - TitleFile <-> JSON (Boost.JSON)
// =============================================================================
//
// Objects are emitted in natural numbering order with no timestamps, so the
// same TitleFile always serializes to the same bytes.

#pragma once

#include <string>
#include <string_view>

#include <boost/json.hpp>

#include "regmetrics/types.hpp"

namespace regmetrics::store {

boost::json::object section_to_json(const SectionRecord& rec);
boost::json::object title_file_to_json(const TitleFile& title);

// Throw StoreError(STORE_READ_FAILED) on missing or mistyped fields
SectionRecord section_from_json(const boost::json::value& v);
TitleFile title_file_from_json(const boost::json::value& v);

std::string serialize_title_file(const TitleFile& title);
TitleFile parse_title_file(std::string_view text, const std::string& origin = "");

// Small accessors shared with the index and version-listing readers
std::string json_string(const boost::json::object& obj, std::string_view key);
std::string json_string_or(const boost::json::object& obj, std::string_view key,
                           const std::string& fallback);

} // namespace regmetrics::store

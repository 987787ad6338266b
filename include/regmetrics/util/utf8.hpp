#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace regmetrics::util {

// Number of codepoints in a UTF-8 string (bytes 0x80-0xBF continue a codepoint and are
// not counted, so a stray continuation byte counts as zero)
size_t codepoint_count(std::string_view data);

// Encode codepoint to UTF-8 bytes
std::string encode_utf8(uint32_t codepoint);

} // namespace regmetrics::util

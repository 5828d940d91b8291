#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace onthisday {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// ASCII lowercase
std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Decode %XX escapes. '+' is left alone (paths, not form data).
std::string percent_decode(const std::string& s);

// Write to a sibling temp file, then rename over path. Creates parent dirs.
bool atomic_write_file(const std::string& path, const std::string& content);

// ── UTF-8 ────────────────────────────────────────────────────────

// True if s is well-formed UTF-8 (no overlongs, no surrogates, <= U+10FFFF).
bool is_valid_utf8(const std::string& s);

// Make s well-formed UTF-8. Surrogate halves encoded as 3-byte sequences
// are joined when they form a pair; anything else invalid becomes U+FFFD.
std::string repair_utf8(const std::string& s);

// Decode permissively: invalid bytes are dropped.
std::string utf8_drop_invalid(const std::string& s);

// Number of code points in a well-formed UTF-8 string.
size_t utf8_length(const std::string& s);

// First max_chars code points of a well-formed UTF-8 string.
std::string utf8_truncate(const std::string& s, size_t max_chars);

// Strip NUL and SOH, then repair_utf8. Used for every text that leaves the core.
std::string sanitize_text(const std::string& s);

// Unicode whitespace: ASCII space and controls \t-\r, 0x1C-0x1F, NEL, NBSP,
// the Zs block and the line/paragraph separators.
bool is_unicode_space(uint32_t cp);

// False for controls, format characters, private use, surrogates,
// noncharacters and separators other than U+0020.
bool is_printable_code_point(uint32_t cp);

// trim() for well-formed UTF-8, stripping every is_unicode_space code point.
std::string utf8_trim(const std::string& s);

} // namespace onthisday

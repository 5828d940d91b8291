#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace onthisday {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, delim)) {
        result.push_back(token);
    }
    return result;
}

std::string replace_all(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.size(), to);
        pos += to.size();
    }
    return result;
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() &&
            std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            char hex[3] = {s[i + 1], s[i + 2], '\0'};
            out += static_cast<char>(std::strtol(hex, nullptr, 16));
            i += 2;
            continue;
        }
        out += s[i];
    }
    return out;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return false;
    }

    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) return false;
        out << content;
        if (!out.good()) return false;
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

// ── UTF-8 ────────────────────────────────────────────────────────

static const char kReplacementChar[] = "\xEF\xBF\xBD";

// Length of the well-formed sequence starting at i, or 0 if there is none.
static size_t valid_sequence_length(const std::string& s, size_t i) {
    auto c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) return 1;

    size_t len;
    uint32_t cp;
    uint32_t min_cp;
    if ((c & 0xE0) == 0xC0) {
        len = 2; cp = c & 0x1F; min_cp = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3; cp = c & 0x0F; min_cp = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4; cp = c & 0x07; min_cp = 0x10000;
    } else {
        return 0;
    }
    if (i + len > s.size()) return 0;

    for (size_t k = 1; k < len; ++k) {
        auto cc = static_cast<unsigned char>(s[i + k]);
        if ((cc & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF) return 0;
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;
    return len;
}

// Value of a surrogate half encoded as ED [A0-BF] [80-BF] at i, or 0.
static uint32_t encoded_surrogate_at(const std::string& s, size_t i) {
    if (i + 3 > s.size()) return 0;
    auto a = static_cast<unsigned char>(s[i]);
    auto b = static_cast<unsigned char>(s[i + 1]);
    auto c = static_cast<unsigned char>(s[i + 2]);
    if (a != 0xED || (b & 0xE0) != 0xA0 || (c & 0xC0) != 0x80) return 0;
    return 0xD000u | (static_cast<uint32_t>(b & 0x3F) << 6) | (c & 0x3Fu);
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        size_t len = valid_sequence_length(s, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

std::string repair_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        size_t len = valid_sequence_length(s, i);
        if (len > 0) {
            out.append(s, i, len);
            i += len;
            continue;
        }

        uint32_t hi = encoded_surrogate_at(s, i);
        if (hi >= 0xD800 && hi <= 0xDBFF) {
            uint32_t lo = encoded_surrogate_at(s, i + 3);
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
                append_utf8(out, 0x10000 + ((hi - 0xD800) << 10) + (lo - 0xDC00));
                i += 6;
                continue;
            }
        }
        out += kReplacementChar;
        i += hi != 0 ? 3 : 1;
    }
    return out;
}

std::string utf8_drop_invalid(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        size_t len = valid_sequence_length(s, i);
        if (len > 0) {
            out.append(s, i, len);
            i += len;
        } else {
            ++i;
        }
    }
    return out;
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string utf8_truncate(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        auto c = static_cast<unsigned char>(s[i]);
        if ((c & 0xC0) != 0x80) {
            if (chars == max_chars) return s.substr(0, i);
            ++chars;
        }
    }
    return s;
}

std::string sanitize_text(const std::string& s) {
    std::string stripped;
    stripped.reserve(s.size());
    for (char c : s) {
        if (c != '\x00' && c != '\x01') stripped += c;
    }
    return repair_utf8(stripped);
}

bool is_unicode_space(uint32_t cp) {
    if ((cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20)) return true;
    switch (cp) {
        case 0x85: case 0xA0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool is_printable_code_point(uint32_t cp) {
    if (cp == ' ') return true;
    if (cp < 0x20 || (cp >= 0x7F && cp <= 0x9F)) return false;
    if (is_unicode_space(cp)) return false;
    // Format characters
    if (cp == 0xAD || cp == 0x61C || cp == 0x6DD || cp == 0x70F || cp == 0x180E) return false;
    if (cp >= 0x600 && cp <= 0x605) return false;
    if (cp >= 0x200B && cp <= 0x200F) return false;
    if (cp >= 0x202A && cp <= 0x202E) return false;
    if (cp >= 0x2060 && cp <= 0x206F) return false;
    if (cp == 0xFEFF || (cp >= 0xFFF9 && cp <= 0xFFFB)) return false;
    if (cp == 0xE0001 || (cp >= 0xE0020 && cp <= 0xE007F)) return false;
    // Surrogates, private use and noncharacters
    if (cp >= 0xD800 && cp <= 0xF8FF) return false;
    if (cp >= 0xF0000) return false;
    if (cp >= 0xFDD0 && cp <= 0xFDEF) return false;
    if ((cp & 0xFFFE) == 0xFFFE) return false;
    return true;
}

// Code point of a sequence already checked by valid_sequence_length.
static uint32_t decode_sequence(const std::string& s, size_t i, size_t len) {
    auto c = static_cast<unsigned char>(s[i]);
    if (len == 1) return c;
    uint32_t cp = c & (0x7Fu >> len);
    for (size_t k = 1; k < len; ++k) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3Fu);
    }
    return cp;
}

std::string utf8_trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size()) {
        size_t len = valid_sequence_length(s, start);
        if (len == 0 || !is_unicode_space(decode_sequence(s, start, len))) break;
        start += len;
    }

    size_t end = s.size();
    while (end > start) {
        size_t lead = end - 1;
        while (lead > start && (static_cast<unsigned char>(s[lead]) & 0xC0) == 0x80) --lead;
        size_t len = valid_sequence_length(s, lead);
        if (len != end - lead || !is_unicode_space(decode_sequence(s, lead, len))) break;
        end = lead;
    }
    return s.substr(start, end - start);
}

} // namespace onthisday

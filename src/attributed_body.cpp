#include "attributed_body.hpp"
#include "util.hpp"

#include <algorithm>
#include <array>

namespace onthisday {

// Class names of the string objects, tried in order.
static const std::array<std::string, 2> kStringMarkers = {"NSString", "NSMutableString"};

ExtractResult decode_length_prefixed(const std::vector<uint8_t>& blob, size_t pos) {
    if (pos >= blob.size()) return {ExtractStatus::MalformedLength, {}};

    uint8_t b = blob[pos];
    uint32_t length = 0;
    size_t start = 0;
    if (b >= 0x01 && b <= 0x7F) {
        length = b;
        start = pos + 1;
    } else if (b == 0x81 && pos + 1 < blob.size()) {
        length = blob[pos + 1];
        start = pos + 2;
    } else if (b == 0x84 && pos + 4 < blob.size()) {
        length = (static_cast<uint32_t>(blob[pos + 1]) << 24) |
                 (static_cast<uint32_t>(blob[pos + 2]) << 16) |
                 (static_cast<uint32_t>(blob[pos + 3]) << 8) |
                 static_cast<uint32_t>(blob[pos + 4]);
        start = pos + 5;
    } else {
        return {ExtractStatus::MalformedLength, {}};
    }

    if (length == 0 || length > kMaxPayloadLength) {
        return {ExtractStatus::MalformedLength, {}};
    }
    if (start + length > blob.size()) {
        return {ExtractStatus::MalformedLength, {}};
    }

    std::string payload(blob.begin() + static_cast<std::ptrdiff_t>(start),
                        blob.begin() + static_cast<std::ptrdiff_t>(start + length));
    if (!is_valid_utf8(payload)) {
        return {ExtractStatus::DecodeFailed, {}};
    }
    return {ExtractStatus::Found, std::move(payload)};
}

ExtractResult decode_string_object(const std::vector<uint8_t>& blob) {
    std::optional<size_t> marker_end;
    for (const auto& marker : kStringMarkers) {
        auto it = std::search(blob.begin(), blob.end(), marker.begin(), marker.end());
        if (it != blob.end()) {
            marker_end = static_cast<size_t>(it - blob.begin()) + marker.size();
            break;
        }
    }
    if (!marker_end) return {ExtractStatus::MarkerNotFound, {}};

    size_t start = *marker_end;
    size_t search_end = blob.size() >= 2
        ? std::min(start + kControlSearchWindow, blob.size() - 2)
        : 0;
    for (size_t pos = start; pos < search_end; ++pos) {
        if (blob[pos] == 0x01 && blob[pos + 1] == 0x2B) {
            return decode_length_prefixed(blob, pos + 2);
        }
    }
    return {ExtractStatus::ControlNotFound, {}};
}

// Decode the code point at s[i] from well-formed UTF-8, advancing i.
static uint32_t next_code_point(const std::string& s, size_t& i) {
    auto c = static_cast<unsigned char>(s[i++]);
    if (c < 0x80) return c;
    int extra = (c & 0xE0) == 0xC0 ? 1 : (c & 0xF0) == 0xE0 ? 2 : 3;
    uint32_t cp = c & (0x3F >> extra);
    for (int k = 0; k < extra && i < s.size(); ++k) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[i++]) & 0x3F);
    }
    return cp;
}

// More than half of the code points are printable.
static bool looks_like_text(const std::string& s) {
    size_t total = 0;
    size_t printable = 0;
    size_t i = 0;
    while (i < s.size()) {
        uint32_t cp = next_code_point(s, i);
        if (cp == '\n' || cp == '\r' || cp == '\t' || is_printable_code_point(cp)) ++printable;
        ++total;
    }
    return total > 0 && static_cast<double>(printable) / static_cast<double>(total) > 0.5;
}

static bool is_run_byte(uint8_t b) {
    return (b >= 0x20 && b < 0x7F) || b == '\t' || b == '\n' || b == '\r' || b >= 0xC0;
}

std::optional<std::string> scan_longest_text_run(const std::vector<uint8_t>& blob) {
    std::string best;
    size_t best_length = 0;

    size_t i = kFallbackScanStart;
    while (i < blob.size()) {
        size_t run_start = i;
        while (i < blob.size() && is_run_byte(blob[i])) ++i;
        if (i > run_start) {
            std::string raw(blob.begin() + static_cast<std::ptrdiff_t>(run_start),
                            blob.begin() + static_cast<std::ptrdiff_t>(i));
            std::string chunk = utf8_trim(utf8_drop_invalid(raw));
            size_t length = utf8_length(chunk);
            if (length > best_length && looks_like_text(chunk)) {
                best = std::move(chunk);
                best_length = length;
            }
        }
        ++i;
    }

    if (best.empty()) return std::nullopt;
    return best;
}

std::optional<std::string> clean_extracted_text(const std::string& text) {
    std::string cleaned = replace_all(text, "\xEF\xBF\xBC", "");  // U+FFFC
    cleaned = utf8_trim(sanitize_text(cleaned));
    if (cleaned.empty()) return std::nullopt;
    return cleaned;
}

std::optional<std::string> extract_text(const std::vector<uint8_t>& blob) {
    if (blob.empty()) return std::nullopt;

    auto result = decode_string_object(blob);
    if (result.found()) {
        // An object-replacement-only body is an attachment placeholder;
        // it must not fall through to the run scan.
        return clean_extracted_text(result.text);
    }

    if (auto run = scan_longest_text_run(blob)) {
        return clean_extracted_text(*run);
    }
    return std::nullopt;
}

std::optional<std::string> extract_text(const std::optional<std::vector<uint8_t>>& blob) {
    if (!blob) return std::nullopt;
    return extract_text(*blob);
}

} // namespace onthisday

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace onthisday {

// Heuristic text recovery from the legacy typedstream blobs stored in
// message.attributedBody when message.text is NULL. This is not a decoder
// for the archive format: it finds the first string object and reads its
// length-prefixed UTF-8 payload, falling back to the longest text-like run.
//
// Observed layout after the class name:
//   ... NSString 01 <type> 84 01 2B <length> <utf8 bytes>
// where <length> is one byte (01-7F), 81 + 1 byte, or 84 + 4 bytes BE.

enum class ExtractStatus {
    Found,
    MarkerNotFound,   // no NSString / NSMutableString class name
    ControlNotFound,  // no 01 2B within the search window after the marker
    MalformedLength,  // bad length prefix, out-of-range length, or overrun
    DecodeFailed,     // payload is not valid UTF-8
};

struct ExtractResult {
    ExtractStatus status = ExtractStatus::MarkerNotFound;
    std::string text;  // set only when status == Found

    bool found() const { return status == ExtractStatus::Found; }
};

constexpr size_t kControlSearchWindow = 20;
constexpr uint32_t kMaxPayloadLength = 100000;
constexpr size_t kFallbackScanStart = 50;

// Read a length-prefixed UTF-8 payload whose length field starts at pos.
ExtractResult decode_length_prefixed(const std::vector<uint8_t>& blob, size_t pos);

// Stages 1-4: locate the string object and decode its payload.
ExtractResult decode_string_object(const std::vector<uint8_t>& blob);

// Stage 5: longest text-looking run from offset 50 on (already trimmed).
std::optional<std::string> scan_longest_text_run(const std::vector<uint8_t>& blob);

// Stage 6: drop U+FFFC, NUL and SOH, repair surrogates, trim. Empty -> absent.
std::optional<std::string> clean_extracted_text(const std::string& text);

// Full pipeline. Never throws.
std::optional<std::string> extract_text(const std::vector<uint8_t>& blob);
std::optional<std::string> extract_text(const std::optional<std::vector<uint8_t>>& blob);

} // namespace onthisday

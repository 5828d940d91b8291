#include <catch2/catch.hpp>
#include "attributed_body.hpp"
#include "test_fixtures.hpp"

using namespace onthisday;

static std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// ── Length prefixes ──────────────────────────────────────────────

TEST_CASE("decode_length_prefixed: single-byte length", "[attributed_body]") {
    auto blob = bytes("\x05hello");
    auto r = decode_length_prefixed(blob, 0);
    REQUIRE(r.found());
    REQUIRE(r.text == "hello");
}

TEST_CASE("decode_length_prefixed: 0x81 two-byte form", "[attributed_body]") {
    std::string text(200, 'a');
    std::vector<uint8_t> blob = {0x81, 200};
    blob.insert(blob.end(), text.begin(), text.end());
    auto r = decode_length_prefixed(blob, 0);
    REQUIRE(r.found());
    REQUIRE(r.text == text);
}

TEST_CASE("decode_length_prefixed: 0x84 big-endian four-byte form", "[attributed_body]") {
    std::string text(300, 'b');
    std::vector<uint8_t> blob = {0x84, 0x00, 0x00, 0x01, 0x2C};
    blob.insert(blob.end(), text.begin(), text.end());
    auto r = decode_length_prefixed(blob, 0);
    REQUIRE(r.found());
    REQUIRE(r.text.size() == 300);
}

TEST_CASE("decode_length_prefixed: rejects zero, oversize and overrun", "[attributed_body]") {
    REQUIRE(decode_length_prefixed(bytes(std::string("\x00" "abc", 4)), 0).status ==
            ExtractStatus::MalformedLength);
    REQUIRE(decode_length_prefixed(bytes("\x10short"), 0).status ==
            ExtractStatus::MalformedLength);

    std::vector<uint8_t> huge = {0x84, 0x00, 0x01, 0x86, 0xA1, 'x'};  // 100001
    REQUIRE(decode_length_prefixed(huge, 0).status == ExtractStatus::MalformedLength);

    std::vector<uint8_t> truncated = {0x84, 0x00, 0x00};
    REQUIRE(decode_length_prefixed(truncated, 0).status == ExtractStatus::MalformedLength);

    std::vector<uint8_t> bad_prefix = {0x90, 'x'};
    REQUIRE(decode_length_prefixed(bad_prefix, 0).status == ExtractStatus::MalformedLength);

    REQUIRE(decode_length_prefixed(bytes("\x01"), 5).status == ExtractStatus::MalformedLength);
}

TEST_CASE("decode_length_prefixed: invalid UTF-8 payload", "[attributed_body]") {
    std::vector<uint8_t> blob = {0x02, 0xFF, 0xFE};
    REQUIRE(decode_length_prefixed(blob, 0).status == ExtractStatus::DecodeFailed);
}

// ── String object ────────────────────────────────────────────────

TEST_CASE("decode_string_object: NSString payload", "[attributed_body]") {
    auto r = decode_string_object(typedstream_body("Happy birthday!"));
    REQUIRE(r.found());
    REQUIRE(r.text == "Happy birthday!");
}

TEST_CASE("decode_string_object: NSMutableString payload", "[attributed_body]") {
    auto r = decode_string_object(typedstream_body("edited", "NSMutableString"));
    REQUIRE(r.found());
    REQUIRE(r.text == "edited");
}

TEST_CASE("decode_string_object: no class name", "[attributed_body]") {
    auto r = decode_string_object(bytes("nothing to see here"));
    REQUIRE(r.status == ExtractStatus::MarkerNotFound);
}

TEST_CASE("decode_string_object: control bytes outside the window", "[attributed_body]") {
    std::vector<uint8_t> blob = bytes("NSString");
    blob.insert(blob.end(), 30, 0x00);
    for (uint8_t b : {0x01, 0x2B, 0x02, 0x68, 0x69}) blob.push_back(b);
    REQUIRE(decode_string_object(blob).status == ExtractStatus::ControlNotFound);
}

// ── Fallback scan ────────────────────────────────────────────────

TEST_CASE("scan_longest_text_run: ignores the first 50 bytes", "[attributed_body]") {
    std::vector<uint8_t> blob = bytes("this header text is long but lives before offset50");
    blob.resize(50);
    blob.push_back(0x00);
    for (char c : std::string("short")) blob.push_back(static_cast<uint8_t>(c));
    blob.push_back(0x02);
    for (char c : std::string("  the longest readable run  ")) blob.push_back(static_cast<uint8_t>(c));
    blob.push_back(0x03);

    auto run = scan_longest_text_run(blob);
    REQUIRE(run.has_value());
    REQUIRE(*run == "the longest readable run");
}

TEST_CASE("scan_longest_text_run: nothing text-like", "[attributed_body]") {
    std::vector<uint8_t> blob(80, 0x02);
    REQUIRE_FALSE(scan_longest_text_run(blob).has_value());
}

// ── Cleaning and full pipeline ───────────────────────────────────

TEST_CASE("clean_extracted_text: strips object replacement and controls", "[attributed_body]") {
    auto cleaned = clean_extracted_text(std::string("\xEF\xBF\xBC  look\x01 at this \x00", 19));
    REQUIRE(cleaned.has_value());
    REQUIRE(*cleaned == "look at this");
    REQUIRE_FALSE(clean_extracted_text("\xEF\xBF\xBC").has_value());
    REQUIRE_FALSE(clean_extracted_text("   ").has_value());
}

TEST_CASE("clean_extracted_text: strips Unicode whitespace at the edges", "[attributed_body]") {
    auto cleaned = clean_extracted_text("\xE3\x80\x80\xEF\xBF\xBC" "see\xC2\xA0you\xC2\xA0\xE2\x80\xA8");
    REQUIRE(cleaned.has_value());
    REQUIRE(*cleaned == "see\xC2\xA0you");
    REQUIRE_FALSE(clean_extracted_text("\xC2\xA0\xEF\xBF\xBC\xE2\x80\xA9").has_value());
}

TEST_CASE("extract_text: payload bordered by Unicode spaces is trimmed", "[attributed_body]") {
    auto text = extract_text(typedstream_body("\xC2\xA0" "Happy birthday!\xE2\x80\xA8"));
    REQUIRE(text.has_value());
    REQUIRE(*text == "Happy birthday!");
}

TEST_CASE("extract_text: decodes a typical body", "[attributed_body]") {
    auto text = extract_text(typedstream_body("See you at 7"));
    REQUIRE(text.has_value());
    REQUIRE(*text == "See you at 7");
}

TEST_CASE("extract_text: absent for null and empty blobs", "[attributed_body]") {
    REQUIRE_FALSE(extract_text(std::optional<std::vector<uint8_t>>{}).has_value());
    REQUIRE_FALSE(extract_text(std::vector<uint8_t>{}).has_value());
}

TEST_CASE("extract_text: attachment-only body stays absent", "[attributed_body]") {
    auto blob = typedstream_body("\xEF\xBF\xBC");
    // Padding long enough that a run scan would find the class names
    std::string tail = "__kIMFileTransferGUIDAttributeName__kIMMessagePartAttributeName";
    blob.insert(blob.end(), tail.begin(), tail.end());
    REQUIRE_FALSE(extract_text(blob).has_value());
}

TEST_CASE("extract_text: falls back to the longest run", "[attributed_body]") {
    std::vector<uint8_t> blob(60, 0x00);
    std::string text = "recovered from the raw bytes";
    blob.insert(blob.end(), text.begin(), text.end());
    blob.push_back(0x00);
    auto extracted = extract_text(blob);
    REQUIRE(extracted.has_value());
    REQUIRE(*extracted == text);
}

TEST_CASE("clean_extracted_text: joins encoded surrogate pairs", "[attributed_body]") {
    auto cleaned = clean_extracted_text("ok \xED\xA0\xBD\xED\xB8\x82");
    REQUIRE(cleaned.has_value());
    REQUIRE(*cleaned == "ok \xF0\x9F\x98\x82");
}

TEST_CASE("extract_text: payload that is not UTF-8 falls back to the run scan", "[attributed_body]") {
    std::vector<uint8_t> blob = bytes("NSString");
    for (uint8_t b : {0x01, 0x2B, 0x02, 0xFF, 0xFE}) blob.push_back(b);
    blob.resize(60, 0x00);
    std::string tail = "plain words after the object";
    blob.insert(blob.end(), tail.begin(), tail.end());
    auto extracted = extract_text(blob);
    REQUIRE(extracted.has_value());
    REQUIRE(*extracted == tail);
}

TEST_CASE("extract_text: never throws on arbitrary bytes", "[attributed_body]") {
    std::vector<uint8_t> blob;
    for (int i = 0; i < 512; ++i) blob.push_back(static_cast<uint8_t>((i * 37) & 0xFF));
    REQUIRE_NOTHROW(extract_text(blob));
}

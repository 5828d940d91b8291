#pragma once
#include "archive/attachments.hpp"
#include "config.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace onthisday {

struct ProcessResult {
    bool exited = false;      // exited on its own (not killed)
    int exit_code = -1;
    bool timed_out = false;
    std::string output;       // stdout + stderr
};

// Run argv[0] (PATH lookup) with argv, killing it after timeout_ms.
ProcessResult run_process(const std::vector<std::string>& argv, int timeout_ms);

// HEIC by MIME type or by ".heic" extension, case-insensitive.
bool is_heic(const std::string& path, const std::optional<std::string>& mime_type);

// Convert with `sips -s format jpeg <source> --out <cache>/<id>.jpg`, reusing
// an earlier conversion. Absent if the tool is missing, fails or times out.
std::optional<std::string> convert_heic_to_jpeg(const std::string& source, int64_t attachment_id,
                                                const AttachmentConfig& cfg);

struct DeliveredAttachment {
    std::string path;
    std::string mime_type;
    bool converted = false;
};

// What to serve for an attachment: a JPEG conversion of HEIC images when
// enabled and possible, the original file otherwise.
DeliveredAttachment prepare_attachment(const AttachmentFile& file, int64_t attachment_id,
                                       const AttachmentConfig& cfg);

} // namespace onthisday

#pragma once
#include "../models.hpp"
#include "database.hpp"
#include <optional>
#include <string>
#include <vector>

namespace onthisday {

struct AttachmentFile {
    std::string path;  // absolute, ~ expanded and percent-decoded
    std::optional<std::string> mime_type;
};

// Access reference the presentation layer serves attachment bytes from.
std::string attachment_url(int64_t attachment_id);

// "~/Library/Messages/Attachments/..%20x.jpg" -> "/Users/me/Library/.. x.jpg"
std::string resolve_attachment_path(const std::string& filename);

// Display name: transfer name, else raw filename, else "attachment".
std::string attachment_display_name(const std::optional<std::string>& transfer_name,
                                    const std::optional<std::string>& filename);

// All attachments linked to a message. Throws StoreError.
std::vector<Attachment> attachments_for_message(const Database& db, int64_t message_id);

// Filesystem location of one attachment; absent if the row or its filename
// is missing. Throws StoreError.
std::optional<AttachmentFile> find_attachment_file(const Database& db, int64_t attachment_id);

} // namespace onthisday

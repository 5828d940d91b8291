#pragma once
#include "models.hpp"
#include "archive/attachments.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace onthisday {

class ContactCache; // forward declaration

// Raised for an unknown conversation or attachment id.
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Read-only view of a Messages chat.db. Every call opens its own
// connection and closes it before returning. Store failures degrade to
// empty results; the only error surfaced is NotFoundError.
class Archive {
public:
    // contacts may be null; names are then left as stored.
    explicit Archive(std::string db_path, ContactCache* contacts = nullptr)
        : db_path_(std::move(db_path)), contacts_(contacts) {}

    const std::string& db_path() const { return db_path_; }

    // Conversations active on month/day in any year, newest first.
    std::vector<ConversationSummary> conversations_on_day(int month, int day) const;

    // Year-grouped messages of one conversation on month/day.
    // Throws NotFoundError for an unknown chat id.
    ConversationTimeline timeline(int64_t chat_id, int month, int day) const;

    // Location and MIME type of an attachment. Absent if unknown.
    std::optional<AttachmentFile> attachment_file(int64_t attachment_id) const;

private:
    std::string db_path_;
    ContactCache* contacts_;
};

} // namespace onthisday

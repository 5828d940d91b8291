#include "archive.hpp"
#include "archive/conversations.hpp"
#include "archive/database.hpp"
#include "archive/timeline.hpp"
#include "contacts.hpp"

namespace onthisday {

std::vector<ConversationSummary> Archive::conversations_on_day(int month, int day) const {
    const ContactBook* book = contacts_ ? &contacts_->get() : nullptr;
    return or_default("conversation listing", std::vector<ConversationSummary>{}, [&]() {
        Database db(db_path_);
        return ConversationReconstructor(db, book).on_day(month, day);
    });
}

ConversationTimeline Archive::timeline(int64_t chat_id, int month, int day) const {
    const ContactBook* book = contacts_ ? &contacts_->get() : nullptr;
    auto result = or_default("conversation timeline", std::optional<ConversationTimeline>{}, [&]() {
        Database db(db_path_);
        return TimelineBuilder(db, book).build(chat_id, month, day);
    });
    if (!result) {
        throw NotFoundError("Chat not found: " + std::to_string(chat_id));
    }
    return std::move(*result);
}

std::optional<AttachmentFile> Archive::attachment_file(int64_t attachment_id) const {
    return or_default("attachment lookup", std::optional<AttachmentFile>{}, [&]() {
        Database db(db_path_);
        return find_attachment_file(db, attachment_id);
    });
}

} // namespace onthisday

#include "timeline.hpp"
#include "attachments.hpp"
#include "chat_queries.hpp"
#include "../attributed_body.hpp"
#include "../contacts.hpp"
#include "../timestamp.hpp"
#include "../util.hpp"

#include <array>
#include <map>
#include <unordered_map>
#include <vector>

namespace onthisday {

Association classify_association(int64_t type) {
    if (type >= kFirstReactionType && type <= kLastReactionType) return Association::Reaction;
    if (type >= kFirstRetractionType) return Association::Retraction;
    return Association::Primary;
}

std::string strip_guid_prefix(const std::string& guid) {
    static const std::array<std::string, 3> prefixes = {"p:0/", "p:1/", "bp:"};
    for (const auto& prefix : prefixes) {
        if (starts_with(guid, prefix)) return guid.substr(prefix.size());
    }
    return guid;
}

std::string tapback_emoji(int64_t type) {
    switch (type) {
        case 2000: return "\xE2\x9D\xA4\xEF\xB8\x8F";  // ❤️ loved
        case 2001: return "\xF0\x9F\x91\x8D";          // 👍 liked
        case 2002: return "\xF0\x9F\x91\x8E";          // 👎 disliked
        case 2003: return "\xF0\x9F\x98\x82";          // 😂 laughed
        case 2004: return "\xE2\x80\xBC\xEF\xB8\x8F";  // ‼️ emphasized
        case 2005: return "\xE2\x9D\x93";              // ❓ questioned
        default:   return "";
    }
}

std::vector<Message> TimelineBuilder::read_messages(int64_t chat_id,
                                                   const std::string& month_day) const {
    auto stmt = db_.prepare(
        "SELECT m.ROWID AS message_id, m.guid, m.text, m.attributedBody, m.is_from_me, "
        "       m.date, m.date_read, m.associated_message_guid, "
        "       m.associated_message_type, h.id AS handle "
        "FROM message m "
        "JOIN chat_message_join cmj ON cmj.message_id = m.ROWID "
        "LEFT JOIN handle h ON h.ROWID = m.handle_id "
        "WHERE cmj.chat_id = ? "
        "AND " + local_date_sql("%m-%d", "m.date") + " = ? "
        "ORDER BY m.date ASC, m.ROWID ASC;");
    stmt.bind(1, chat_id);
    stmt.bind(2, month_day);

    // Reactions usually arrive after the message they target, so collect
    // everything first and attach afterwards.
    std::vector<Message> primaries;
    std::unordered_map<std::string, std::vector<Tapback>> tapbacks_by_guid;

    while (stmt.step()) {
        auto row = stmt.row();
        int64_t assoc_type = row.integer("associated_message_type").value_or(0);
        bool from_me = row.integer("is_from_me").value_or(0) != 0;

        switch (classify_association(assoc_type)) {
            case Association::Retraction:
                continue;
            case Association::Reaction: {
                Tapback tb;
                tb.type = assoc_type;
                tb.emoji = tapback_emoji(assoc_type);
                tb.from_me = from_me;
                tb.target_guid = strip_guid_prefix(row.text("associated_message_guid").value_or(""));
                tapbacks_by_guid[tb.target_guid].push_back(std::move(tb));
                continue;
            }
            case Association::Primary:
                break;
        }

        Message msg;
        msg.id = row.integer("message_id").value_or(0);
        msg.guid = row.text("guid").value_or("");
        msg.is_from_me = from_me;

        auto raw_text = row.text("text");
        if (raw_text) msg.text = sanitize_text(*raw_text);
        if (!msg.text || msg.text->empty()) {
            if (auto extracted = extract_text(row.blob("attributedBody"))) {
                msg.text = std::move(extracted);
            }
        }

        auto date = row.integer("date");
        msg.date = archive_to_local_iso(date);
        msg.date_read = archive_to_local_iso(row.integer("date_read"));
        msg.year = archive_local_year(date.value_or(0));

        auto handle = row.text("handle");
        if (handle && !handle->empty()) {
            msg.handle = handle;
            msg.sender = contacts_ ? contacts_->resolve_name(*handle) : *handle;
        } else if (msg.is_from_me) {
            msg.sender = std::string("Me");
        }

        primaries.push_back(std::move(msg));
    }

    for (auto& msg : primaries) {
        auto it = tapbacks_by_guid.find(msg.guid);
        if (!msg.guid.empty() && it != tapbacks_by_guid.end()) {
            msg.tapbacks = it->second;
        }
    }
    return primaries;
}

std::optional<ConversationTimeline> TimelineBuilder::build(int64_t chat_id, int month,
                                                           int day) const {
    auto chat = or_default("conversation lookup", std::optional<ChatRecord>{},
                           [&]() { return find_chat(db_, chat_id); });
    if (!chat) return std::nullopt;

    ConversationTimeline timeline;
    timeline.chat_id = chat->id;
    timeline.raw_display_name = sanitize_text(chat->name());
    timeline.style = chat->style;
    timeline.is_group = chat->is_group();
    timeline.handles = or_default("conversation handles", std::vector<std::string>{},
                                  [&]() { return chat_handles(db_, chat_id); });
    timeline.display_name = contacts_
        ? contacts_->resolve_conversation_name(timeline.raw_display_name, timeline.handles,
                                               timeline.is_group)
        : timeline.raw_display_name;

    auto messages = or_default("conversation messages", std::vector<Message>{}, [&]() {
        return read_messages(chat_id, month_day_key(month, day));
    });

    std::map<int, std::vector<Message>> by_year;
    for (auto& msg : messages) {
        msg.attachments = or_default("message attachments", std::vector<Attachment>{},
                                     [&]() { return attachments_for_message(db_, msg.id); });
        by_year[msg.year].push_back(std::move(msg));
    }

    for (auto& [year, year_messages] : by_year) {
        timeline.year_groups.push_back(YearGroup{year, std::move(year_messages)});
    }
    return timeline;
}

} // namespace onthisday

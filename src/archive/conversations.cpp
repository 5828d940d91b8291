#include "conversations.hpp"
#include "chat_queries.hpp"
#include "../attributed_body.hpp"
#include "../contacts.hpp"
#include "../timestamp.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>

namespace onthisday {

std::vector<int> parse_years(const std::string& concatenated) {
    std::vector<int> years;
    for (const auto& part : split(concatenated, ',')) {
        std::string token = trim(part);
        if (token.empty()) continue;
        char* end = nullptr;
        long value = std::strtol(token.c_str(), &end, 10);
        if (end == nullptr || *end != '\0') continue;
        years.push_back(static_cast<int>(value));
    }
    std::sort(years.begin(), years.end(), std::greater<int>());
    years.erase(std::unique(years.begin(), years.end()), years.end());
    return years;
}

std::vector<ConversationSummary> ConversationReconstructor::on_day(int month, int day) const {
    const std::string month_day = month_day_key(month, day);

    auto stmt = db_.prepare(
        "SELECT c.ROWID AS chat_id, c.display_name, c.style AS chat_style, "
        "       c.chat_identifier, "
        "       COUNT(DISTINCT m.ROWID) AS message_count, "
        "       GROUP_CONCAT(DISTINCT " + local_date_sql("%Y", "m.date") + ") AS years, "
        "       MAX(m.date) AS last_date "
        "FROM chat c "
        "JOIN chat_message_join cmj ON cmj.chat_id = c.ROWID "
        "JOIN message m ON m.ROWID = cmj.message_id "
        "WHERE " + local_date_sql("%m-%d", "m.date") + " = ? "
        "GROUP BY c.ROWID "
        "ORDER BY last_date DESC, c.ROWID ASC;");
    stmt.bind(1, month_day);

    std::vector<ConversationSummary> conversations;
    while (stmt.step()) {
        auto row = stmt.row();

        ConversationSummary conv;
        conv.chat_id = row.integer("chat_id").value_or(0);
        ChatRecord chat;
        chat.id = conv.chat_id;
        chat.display_name = row.text("display_name");
        chat.chat_identifier = row.text("chat_identifier");
        chat.style = row.integer("chat_style").value_or(0);

        conv.raw_display_name = sanitize_text(chat.name());
        conv.style = chat.style;
        conv.is_group = chat.is_group();
        conv.message_count = row.integer("message_count").value_or(0);
        conv.years = parse_years(row.text("years").value_or(""));
        conv.last_message_date = archive_to_local_iso(row.integer("last_date"));

        conv.handles = or_default("conversation handles", std::vector<std::string>{},
                                  [&]() { return chat_handles(db_, conv.chat_id); });
        conv.last_message_preview = or_default("conversation preview", std::string{},
                                               [&]() { return latest_preview(conv.chat_id, month_day); });

        conv.display_name = contacts_
            ? contacts_->resolve_conversation_name(conv.raw_display_name, conv.handles, conv.is_group)
            : conv.raw_display_name;

        conversations.push_back(std::move(conv));
    }
    return conversations;
}

std::string ConversationReconstructor::latest_preview(int64_t chat_id,
                                                      const std::string& month_day) const {
    auto stmt = db_.prepare(
        "SELECT m.text, m.attributedBody "
        "FROM message m "
        "JOIN chat_message_join cmj ON cmj.message_id = m.ROWID "
        "WHERE cmj.chat_id = ? "
        "AND " + local_date_sql("%m-%d", "m.date") + " = ? "
        "ORDER BY m.date DESC "
        "LIMIT 1;");
    stmt.bind(1, chat_id);
    stmt.bind(2, month_day);
    if (!stmt.step()) return {};

    auto row = stmt.row();
    std::string preview = sanitize_text(row.text("text").value_or(""));
    if (preview.empty()) {
        preview = extract_text(row.blob("attributedBody")).value_or("");
    }
    return utf8_truncate(preview, kPreviewLength);
}

} // namespace onthisday

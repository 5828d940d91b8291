#include "chat_queries.hpp"
#include "../models.hpp"
#include "../timestamp.hpp"

namespace onthisday {

std::string local_date_sql(const std::string& format, const std::string& column) {
    return "strftime('" + format + "', datetime(" + column + " / " +
           std::to_string(static_cast<int64_t>(kNanosPerSecond)) + " + " +
           std::to_string(kArchiveEpochOffset) + ", 'unixepoch', 'localtime'))";
}

std::string ChatRecord::name() const {
    if (display_name && !display_name->empty()) return *display_name;
    if (chat_identifier && !chat_identifier->empty()) return *chat_identifier;
    return {};
}

bool ChatRecord::is_group() const {
    return style == kGroupChatStyle;
}

std::optional<ChatRecord> find_chat(const Database& db, int64_t chat_id) {
    auto stmt = db.prepare(
        "SELECT ROWID AS chat_id, display_name, style, chat_identifier "
        "FROM chat WHERE ROWID = ?;");
    stmt.bind(1, chat_id);
    if (!stmt.step()) return std::nullopt;

    auto row = stmt.row();
    ChatRecord chat;
    chat.id = row.integer("chat_id").value_or(chat_id);
    chat.display_name = row.text("display_name");
    chat.chat_identifier = row.text("chat_identifier");
    chat.style = row.integer("style").value_or(0);
    return chat;
}

std::vector<std::string> chat_handles(const Database& db, int64_t chat_id) {
    auto stmt = db.prepare(
        "SELECT h.id AS handle "
        "FROM handle h "
        "JOIN chat_handle_join chj ON chj.handle_id = h.ROWID "
        "WHERE chj.chat_id = ? "
        "ORDER BY h.ROWID;");
    stmt.bind(1, chat_id);

    std::vector<std::string> handles;
    while (stmt.step()) {
        if (auto h = stmt.row().text("handle")) handles.push_back(std::move(*h));
    }
    return handles;
}

} // namespace onthisday

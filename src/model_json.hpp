#pragma once
#include "models.hpp"
#include <nlohmann/json.hpp>

namespace onthisday {

// JSON shapes served to the presentation layer.

inline nlohmann::json optional_to_json(const std::optional<std::string>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

inline nlohmann::json attachment_to_json(const Attachment& a) {
    return {
        {"id", a.id},
        {"filename", a.filename},
        {"mime_type", optional_to_json(a.mime_type)},
        {"url", a.url}
    };
}

inline nlohmann::json tapback_to_json(const Tapback& t) {
    return {
        {"type", t.type},
        {"emoji", t.emoji},
        {"from_me", t.from_me}
    };
}

inline nlohmann::json message_to_json(const Message& m) {
    nlohmann::json attachments = nlohmann::json::array();
    for (const auto& a : m.attachments) attachments.push_back(attachment_to_json(a));
    nlohmann::json tapbacks = nlohmann::json::array();
    for (const auto& t : m.tapbacks) tapbacks.push_back(tapback_to_json(t));

    return {
        {"id", m.id},
        {"text", optional_to_json(m.text)},
        {"is_from_me", m.is_from_me},
        {"date", optional_to_json(m.date)},
        {"date_read", optional_to_json(m.date_read)},
        {"year", m.year},
        {"sender", optional_to_json(m.sender)},
        {"handle", optional_to_json(m.handle)},
        {"attachments", attachments},
        {"tapbacks", tapbacks}
    };
}

inline nlohmann::json summary_to_json(const ConversationSummary& c) {
    return {
        {"chat_id", c.chat_id},
        {"display_name", c.display_name},
        {"handles", c.handles},
        {"is_group", c.is_group},
        {"message_count", c.message_count},
        {"years", c.years},
        {"last_message_preview", c.last_message_preview},
        {"last_message_date", optional_to_json(c.last_message_date)}
    };
}

inline nlohmann::json timeline_to_json(const ConversationTimeline& t) {
    nlohmann::json groups = nlohmann::json::array();
    for (const auto& g : t.year_groups) {
        nlohmann::json messages = nlohmann::json::array();
        for (const auto& m : g.messages) messages.push_back(message_to_json(m));
        groups.push_back(nlohmann::json{{"year", g.year}, {"messages", messages}});
    }
    return {
        {"chat_id", t.chat_id},
        {"display_name", t.display_name},
        {"handles", t.handles},
        {"is_group", t.is_group},
        {"year_groups", groups}
    };
}

} // namespace onthisday

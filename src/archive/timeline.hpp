#pragma once
#include "../models.hpp"
#include "database.hpp"
#include <optional>
#include <string>
#include <vector>

namespace onthisday {

class ContactBook; // forward declaration

// How a message row relates to another message via associated_message_type.
enum class Association { Primary, Reaction, Retraction };

constexpr int64_t kFirstReactionType = 2000;  // heart
constexpr int64_t kLastReactionType = 2005;   // question
constexpr int64_t kFirstRetractionType = 3000;

Association classify_association(int64_t type);

// Drop the "p:0/", "p:1/" or "bp:" part prefix from an associated guid.
std::string strip_guid_prefix(const std::string& guid);

// Emoji for a reaction type, "" for anything outside 2000..2005.
std::string tapback_emoji(int64_t type);

// Builds the year-grouped message timeline of one conversation for a
// calendar day across all years.
class TimelineBuilder {
public:
    // contacts may be null; names are then left unresolved.
    explicit TimelineBuilder(const Database& db, const ContactBook* contacts = nullptr)
        : db_(db), contacts_(contacts) {}

    // Absent when the conversation does not exist. Failing sub-queries
    // (handles, messages, attachments) degrade to empty lists.
    std::optional<ConversationTimeline> build(int64_t chat_id, int month, int day) const;

private:
    // Primary messages of the day in order, with their tapbacks attached.
    std::vector<Message> read_messages(int64_t chat_id, const std::string& month_day) const;

    const Database& db_;
    const ContactBook* contacts_;
};

} // namespace onthisday

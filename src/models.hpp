#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace onthisday {

// Style code the Messages store uses for group chats.
constexpr int64_t kGroupChatStyle = 43;

struct Attachment {
    int64_t id = 0;
    std::string filename;
    std::optional<std::string> mime_type;
    std::string url;
};

struct Tapback {
    int64_t type = 0;  // 2000..2005
    std::string emoji;
    bool from_me = false;
    std::string target_guid;
};

struct Message {
    int64_t id = 0;
    std::string guid;
    std::optional<std::string> text;
    bool is_from_me = false;
    std::optional<std::string> date;       // ISO 8601, local time
    std::optional<std::string> date_read;  // ISO 8601, local time
    int year = 0;
    std::optional<std::string> sender;     // resolved name, or "Me"
    std::optional<std::string> handle;     // raw phone/email
    std::vector<Attachment> attachments;
    std::vector<Tapback> tapbacks;
};

struct YearGroup {
    int year = 0;
    std::vector<Message> messages;
};

struct ConversationSummary {
    int64_t chat_id = 0;
    std::string raw_display_name;  // display_name, else chat_identifier
    std::string display_name;      // after contact resolution
    std::vector<std::string> handles;
    bool is_group = false;
    int64_t style = 0;
    int64_t message_count = 0;
    std::vector<int> years;        // strictly descending
    std::string last_message_preview;
    std::optional<std::string> last_message_date;
};

struct ConversationTimeline {
    int64_t chat_id = 0;
    std::string raw_display_name;
    std::string display_name;
    std::vector<std::string> handles;
    bool is_group = false;
    int64_t style = 0;
    std::vector<YearGroup> year_groups;  // ascending by year
};

} // namespace onthisday

#pragma once
#include "database.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace onthisday {

// SQL expression for the local civil date of an archive timestamp column,
// formatted with the given strftime pattern ("%m-%d", "%Y", ...).
std::string local_date_sql(const std::string& format, const std::string& column);

struct ChatRecord {
    int64_t id = 0;
    std::optional<std::string> display_name;
    std::optional<std::string> chat_identifier;
    int64_t style = 0;

    // display_name, else chat_identifier, else "".
    std::string name() const;
    bool is_group() const;
};

// Chat row by id. Throws StoreError.
std::optional<ChatRecord> find_chat(const Database& db, int64_t chat_id);

// Participant handles (phone numbers / emails) of a chat. Throws StoreError.
std::vector<std::string> chat_handles(const Database& db, int64_t chat_id);

} // namespace onthisday

#pragma once
#include "../models.hpp"
#include "database.hpp"
#include <string>
#include <vector>

namespace onthisday {

class ContactBook; // forward declaration

constexpr size_t kPreviewLength = 100;

// Finds every conversation with activity on a calendar day across all years.
class ConversationReconstructor {
public:
    // contacts may be null; display names are then left unresolved.
    explicit ConversationReconstructor(const Database& db,
                                       const ContactBook* contacts = nullptr)
        : db_(db), contacts_(contacts) {}

    // Conversations with at least one message on month/day (local time),
    // most recent activity first. Throws StoreError if the main query fails;
    // per-conversation lookups degrade to empty values instead.
    std::vector<ConversationSummary> on_day(int month, int day) const;

private:
    std::string latest_preview(int64_t chat_id, const std::string& month_day) const;

    const Database& db_;
    const ContactBook* contacts_;
};

// "2023,2019,2023,x" -> {2023, 2019}: numeric, unique, descending.
std::vector<int> parse_years(const std::string& concatenated);

} // namespace onthisday

#pragma once
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace onthisday {

// Strip every non-digit; keep the last 10 digits when there are more.
// An empty result means the input cannot be matched.
std::string normalize_phone(const std::string& s);

// True for display names that are really raw identifiers: empty, "+...",
// digits with - ( ) and spaces, or "chat<digits>".
bool looks_like_identifier(const std::string& name);

// Lookup from normalized phone number / lowercase email to display name.
class ContactBook {
public:
    void add_phone(const std::string& phone, const std::string& name);
    void add_email(const std::string& email, const std::string& name);

    // Resolve a handle to a contact name; returns the handle on a miss.
    std::string resolve_name(const std::string& handle) const;

    // Name to show for a conversation.
    std::string resolve_conversation_name(const std::string& display_name,
                                          const std::vector<std::string>& handles,
                                          bool is_group) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::unordered_map<std::string, std::string> entries_;
};

// AddressBook databases under root: Sources/*/AddressBook-v22.abcddb plus
// the top-level AddressBook-v22.abcddb.
std::vector<std::string> find_address_books(const std::string& root);

// Read names, phone numbers and emails from each database. Unreadable
// databases or tables are logged and skipped.
ContactBook load_address_books(const std::vector<std::string>& paths);

// Process-wide contact book, built on first use by loader and never
// rebuilt afterwards.
class ContactCache {
public:
    using Loader = std::function<ContactBook()>;

    explicit ContactCache(Loader loader) : loader_(std::move(loader)) {}

    // Non-copyable
    ContactCache(const ContactCache&) = delete;
    ContactCache& operator=(const ContactCache&) = delete;

    const ContactBook& get();

private:
    Loader loader_;
    std::once_flag once_;
    ContactBook book_;
};

} // namespace onthisday

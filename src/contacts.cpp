#include "contacts.hpp"
#include "archive/database.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace onthisday {

static constexpr size_t kPhoneDigits = 10;
static constexpr size_t kGroupNameLimit = 4;
static const char* const kAddressBookFile = "AddressBook-v22.abcddb";

std::string normalize_phone(const std::string& s) {
    std::string digits;
    for (char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
    }
    if (digits.size() > kPhoneDigits) {
        digits = digits.substr(digits.size() - kPhoneDigits);
    }
    return digits;
}

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

bool looks_like_identifier(const std::string& name) {
    if (name.empty()) return true;

    std::string stripped = trim(name);
    if (starts_with(stripped, "+")) return true;

    std::string compact;
    for (char c : stripped) {
        if (c != '-' && c != '(' && c != ')' && c != ' ') compact += c;
    }
    if (all_digits(compact)) return true;

    // Chat identifiers like "chat503893739398632983"
    return starts_with(stripped, "chat") && all_digits(stripped.substr(4));
}

// ── ContactBook ──────────────────────────────────────────────

void ContactBook::add_phone(const std::string& phone, const std::string& name) {
    std::string key = normalize_phone(phone);
    if (!key.empty() && !name.empty()) entries_[key] = name;
}

void ContactBook::add_email(const std::string& email, const std::string& name) {
    if (!email.empty() && !name.empty()) entries_[to_lower(email)] = name;
}

std::string ContactBook::resolve_name(const std::string& handle) const {
    if (handle.empty()) return handle;

    if (handle.find('@') != std::string::npos) {
        auto it = entries_.find(to_lower(handle));
        return it != entries_.end() ? it->second : handle;
    }

    std::string normalized = normalize_phone(handle);
    if (!normalized.empty()) {
        auto it = entries_.find(normalized);
        if (it != entries_.end()) return it->second;
    }
    return handle;
}

std::string ContactBook::resolve_conversation_name(const std::string& display_name,
                                                   const std::vector<std::string>& handles,
                                                   bool is_group) const {
    if (!display_name.empty() && !looks_like_identifier(display_name)) {
        return display_name;
    }

    if (handles.empty()) {
        if (!display_name.empty()) {
            std::string resolved = resolve_name(display_name);
            if (resolved != display_name) return resolved;
        }
        return display_name.empty() ? "Unknown" : display_name;
    }

    std::vector<std::string> names;
    names.reserve(handles.size());
    for (const auto& h : handles) {
        names.push_back(resolve_name(h));
    }

    if (!is_group) return names.front();

    std::string joined;
    for (size_t i = 0; i < names.size() && i < kGroupNameLimit; ++i) {
        if (i > 0) joined += ", ";
        joined += names[i];
    }
    if (names.size() > kGroupNameLimit) joined += "...";
    return joined;
}

// ── AddressBook loading ──────────────────────────────────────

std::vector<std::string> find_address_books(const std::string& root) {
    namespace fs = std::filesystem;
    std::vector<std::string> paths;
    std::error_code ec;

    fs::path sources = fs::path(root) / "Sources";
    if (fs::is_directory(sources, ec)) {
        for (fs::directory_iterator it(sources, ec), end; !ec && it != end; it.increment(ec)) {
            fs::path candidate = it->path() / kAddressBookFile;
            if (fs::is_regular_file(candidate, ec)) paths.push_back(candidate.string());
        }
        std::sort(paths.begin(), paths.end());
    }

    fs::path main_db = fs::path(root) / kAddressBookFile;
    if (fs::is_regular_file(main_db, ec) &&
        std::find(paths.begin(), paths.end(), main_db.string()) == paths.end()) {
        paths.push_back(main_db.string());
    }
    return paths;
}

static std::string record_name(const Row& row) {
    std::string first = row.text("ZFIRSTNAME").value_or("");
    std::string last = row.text("ZLASTNAME").value_or("");
    return trim(first + " " + last);
}

static size_t load_phone_numbers(const Database& db, ContactBook& book) {
    auto stmt = db.prepare(
        "SELECT r.ZFIRSTNAME, r.ZLASTNAME, p.ZFULLNUMBER "
        "FROM ZABCDRECORD r "
        "JOIN ZABCDPHONENUMBER p ON p.ZOWNER = r.Z_PK "
        "WHERE p.ZFULLNUMBER IS NOT NULL;");
    size_t added = 0;
    while (stmt.step()) {
        auto row = stmt.row();
        std::string name = record_name(row);
        auto number = row.text("ZFULLNUMBER");
        if (name.empty() || !number || normalize_phone(*number).empty()) continue;
        book.add_phone(*number, name);
        ++added;
    }
    return added;
}

static size_t load_email_addresses(const Database& db, ContactBook& book) {
    auto stmt = db.prepare(
        "SELECT r.ZFIRSTNAME, r.ZLASTNAME, e.ZADDRESS "
        "FROM ZABCDRECORD r "
        "JOIN ZABCDEMAILADDRESS e ON e.ZOWNER = r.Z_PK "
        "WHERE e.ZADDRESS IS NOT NULL;");
    size_t added = 0;
    while (stmt.step()) {
        auto row = stmt.row();
        std::string name = record_name(row);
        auto address = row.text("ZADDRESS");
        if (name.empty() || !address || address->empty()) continue;
        book.add_email(*address, name);
        ++added;
    }
    return added;
}

ContactBook load_address_books(const std::vector<std::string>& paths) {
    ContactBook book;
    for (const auto& path : paths) {
        or_default("address book " + path, false, [&]() {
            Database db(path);
            or_default("address book phone numbers", size_t{0},
                       [&]() { return load_phone_numbers(db, book); });
            or_default("address book email addresses", size_t{0},
                       [&]() { return load_email_addresses(db, book); });
            return true;
        });
    }
    std::cerr << "[contacts] Loaded " << book.size() << " contacts from "
              << paths.size() << " address book(s)\n";
    return book;
}

// ── ContactCache ─────────────────────────────────────────────

const ContactBook& ContactCache::get() {
    std::call_once(once_, [this]() {
        if (loader_) book_ = loader_();
    });
    return book_;
}

} // namespace onthisday

#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace onthisday {

struct ContactsConfig {
    bool enabled = true;
    std::string address_book_root = "~/Library/Application Support/AddressBook";
};

struct AttachmentConfig {
    bool convert_heic = true;
    std::string cache_dir;          // empty = <tmp>/on-this-day-imessage-cache
    uint32_t convert_timeout = 10;  // seconds

    // cache_dir, or the default under the system temp directory (/tmp when
    // TMPDIR does not name a usable directory).
    std::string effective_cache_dir() const;

    // convert_timeout in milliseconds, clamped to what fits an int.
    int convert_timeout_ms() const;
};

struct Config {
    std::string archive_path = "~/Library/Messages/chat.db";
    ContactsConfig contacts;
    AttachmentConfig attachments;

    // Load from ~/.onthisday/config.json + env vars. Paths come back with
    // ~ expanded.
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();
};

} // namespace onthisday

#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace onthisday {

std::string AttachmentConfig::effective_cache_dir() const {
    if (!cache_dir.empty()) return cache_dir;
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return (tmp / "on-this-day-imessage-cache").string();
}

int AttachmentConfig::convert_timeout_ms() const {
    int64_t ms = static_cast<int64_t>(convert_timeout) * 1000;
    return static_cast<int>(std::min<int64_t>(ms, std::numeric_limits<int>::max()));
}

nlohmann::json Config::defaults_json() {
    return {
        {"archive_path", "~/Library/Messages/chat.db"},
        {"contacts", {
            {"enabled", true},
            {"address_book_root", "~/Library/Application Support/AddressBook"}
        }},
        {"attachments", {
            {"convert_heic", true},
            {"cache_dir", ""},
            {"convert_timeout", 10}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.onthisday/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path << ": "
                      << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    if (j.contains("archive_path") && j["archive_path"].is_string())
        cfg.archive_path = j["archive_path"].get<std::string>();

    if (j.contains("contacts") && j["contacts"].is_object()) {
        auto& c = j["contacts"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.contacts.enabled = c["enabled"].get<bool>();
        if (c.contains("address_book_root") && c["address_book_root"].is_string())
            cfg.contacts.address_book_root = c["address_book_root"].get<std::string>();
    }

    if (j.contains("attachments") && j["attachments"].is_object()) {
        auto& a = j["attachments"];
        if (a.contains("convert_heic") && a["convert_heic"].is_boolean())
            cfg.attachments.convert_heic = a["convert_heic"].get<bool>();
        if (a.contains("cache_dir") && a["cache_dir"].is_string())
            cfg.attachments.cache_dir = a["cache_dir"].get<std::string>();
        if (a.contains("convert_timeout") && a["convert_timeout"].is_number_unsigned())
            cfg.attachments.convert_timeout = a["convert_timeout"].get<uint32_t>();
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("ONTHISDAY_ARCHIVE_PATH"))
        cfg.archive_path = v;
    if (const char* v = std::getenv("ONTHISDAY_ADDRESS_BOOK_ROOT"))
        cfg.contacts.address_book_root = v;
    if (const char* v = std::getenv("ONTHISDAY_CACHE_DIR"))
        cfg.attachments.cache_dir = v;

    cfg.archive_path = expand_home(cfg.archive_path);
    cfg.contacts.address_book_root = expand_home(cfg.contacts.address_book_root);
    cfg.attachments.cache_dir = expand_home(cfg.attachments.cache_dir);

    return cfg;
}

} // namespace onthisday

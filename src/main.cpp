#include "archive.hpp"
#include "attachment_delivery.hpp"
#include "config.hpp"
#include "contacts.hpp"
#include "model_json.hpp"
#include "timestamp.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

static constexpr int kExitNotFound = 2;

static void print_usage() {
    std::cout << "Usage: onthisday <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  conversations          List conversations with messages on the day, any year\n"
              << "  messages CHAT_ID       Show a conversation's messages on the day, grouped by year\n"
              << "  attachment ID          Show the file and MIME type served for an attachment\n"
              << "\n"
              << "Options:\n"
              << "  --month M              Month 1-12 (default: today)\n"
              << "  --day D                Day 1-31 (default: today)\n"
              << "  --db PATH              Messages database (default: ~/Library/Messages/chat.db)\n"
              << "  --out FILE             attachment: copy the served bytes to FILE\n"
              << "  --no-contacts          Do not resolve names from the address book\n"
              << "  -h, --help             Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  ONTHISDAY_ARCHIVE_PATH       Messages database path\n"
              << "  ONTHISDAY_ADDRESS_BOOK_ROOT  AddressBook directory\n"
              << "  ONTHISDAY_CACHE_DIR          Converted image cache directory\n";
}

static std::optional<int64_t> parse_int(const char* s) {
    if (!s || *s == '\0') return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0') return std::nullopt;
    return static_cast<int64_t>(v);
}

static void print_json(const nlohmann::json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

static int run_attachment(const onthisday::Archive& archive, int64_t attachment_id,
                          const std::string& out_path, const onthisday::Config& config) {
    auto file = archive.attachment_file(attachment_id);
    std::error_code ec;
    if (!file || !std::filesystem::exists(file->path, ec)) {
        std::cerr << "Attachment not found: " << attachment_id << "\n";
        return kExitNotFound;
    }

    auto delivered = onthisday::prepare_attachment(*file, attachment_id, config.attachments);
    if (!out_path.empty()) {
        std::filesystem::copy_file(delivered.path, out_path,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            std::cerr << "Error: cannot write " << out_path << ": " << ec.message() << "\n";
            return 1;
        }
    }

    print_json({
        {"id", attachment_id},
        {"path", delivered.path},
        {"mime_type", delivered.mime_type},
        {"converted", delivered.converted}
    });
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string command;
    std::optional<int64_t> target_id;
    std::optional<int64_t> month;
    std::optional<int64_t> day;
    std::string db_path;
    std::string out_path;
    bool use_contacts = true;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--month") == 0 && i + 1 < argc) {
            month = parse_int(argv[++i]);
            if (!month || *month < 1 || *month > 12) {
                std::cerr << "Invalid --month (expected 1-12)\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--day") == 0 && i + 1 < argc) {
            day = parse_int(argv[++i]);
            if (!day || *day < 1 || *day > 31) {
                std::cerr << "Invalid --day (expected 1-31)\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (std::strcmp(argv[i], "--out") == 0 && i + 1 < argc) {
            out_path = argv[++i];
        } else if (std::strcmp(argv[i], "--no-contacts") == 0) {
            use_contacts = false;
        } else if (argv[i][0] != '-' && command.empty()) {
            command = argv[i];
        } else if (argv[i][0] != '-' && !target_id) {
            target_id = parse_int(argv[i]);
            if (!target_id) {
                std::cerr << "Invalid id: " << argv[i] << "\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (command.empty()) {
        print_usage();
        return 1;
    }

    auto config = onthisday::Config::load();
    if (!db_path.empty()) {
        config.archive_path = db_path;
    }

    onthisday::ContactCache contacts([&config]() {
        if (!config.contacts.enabled) return onthisday::ContactBook{};
        return onthisday::load_address_books(
            onthisday::find_address_books(config.contacts.address_book_root));
    });
    onthisday::Archive archive(config.archive_path, use_contacts ? &contacts : nullptr);

    auto now = onthisday::today();
    int m = static_cast<int>(month.value_or(now.month));
    int d = static_cast<int>(day.value_or(now.day));

    if (command == "conversations") {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& conv : archive.conversations_on_day(m, d)) {
            list.push_back(onthisday::summary_to_json(conv));
        }
        print_json({{"month", m}, {"day", d}, {"conversations", list}});
        return 0;
    }

    if (command == "messages") {
        if (!target_id) {
            std::cerr << "Usage: onthisday messages CHAT_ID [--month M] [--day D]\n";
            return 1;
        }
        try {
            print_json(onthisday::timeline_to_json(archive.timeline(*target_id, m, d)));
        } catch (const onthisday::NotFoundError& e) {
            std::cerr << e.what() << "\n";
            return kExitNotFound;
        }
        return 0;
    }

    if (command == "attachment") {
        if (!target_id) {
            std::cerr << "Usage: onthisday attachment ID [--out FILE]\n";
            return 1;
        }
        return run_attachment(archive, *target_id, out_path, config);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}

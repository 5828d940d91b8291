#include <catch2/catch.hpp>
#include "contacts.hpp"
#include <atomic>
#include <filesystem>
#include <sqlite3.h>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace onthisday;

namespace fs = std::filesystem;

// ── normalize_phone ──────────────────────────────────────────────

TEST_CASE("normalize_phone: keeps the last ten digits", "[contacts]") {
    REQUIRE(normalize_phone("+1 (555) 123-4567") == "5551234567");
    REQUIRE(normalize_phone("555-123-4567") == "5551234567");
    REQUIRE(normalize_phone("+44 20 7946 0958") == "2079460958");
}

TEST_CASE("normalize_phone: no zero padding", "[contacts]") {
    REQUIRE(normalize_phone("+1 (415) 555-2671") == "4155552671");
    REQUIRE(normalize_phone("555-2671") == "5552671");
}

TEST_CASE("normalize_phone: short numbers kept whole", "[contacts]") {
    REQUIRE(normalize_phone("12345") == "12345");
    REQUIRE(normalize_phone("no digits").empty());
}

// ── looks_like_identifier ────────────────────────────────────────

TEST_CASE("looks_like_identifier: raw identifiers", "[contacts]") {
    REQUIRE(looks_like_identifier(""));
    REQUIRE(looks_like_identifier("+15551234567"));
    REQUIRE(looks_like_identifier("(555) 123-4567"));
    REQUIRE(looks_like_identifier("chat503893739398632983"));
}

TEST_CASE("looks_like_identifier: real names", "[contacts]") {
    REQUIRE_FALSE(looks_like_identifier("Family"));
    REQUIRE_FALSE(looks_like_identifier("chat group"));
    REQUIRE_FALSE(looks_like_identifier("Book Club 2019"));
    REQUIRE_FALSE(looks_like_identifier("alice@example.com"));
}

// ── ContactBook ──────────────────────────────────────────────────

static ContactBook sample_book() {
    ContactBook book;
    book.add_phone("+1 (555) 123-4567", "Alice Smith");
    book.add_phone("555-987-6543", "Bob Jones");
    book.add_email("Carol@Example.com", "Carol White");
    return book;
}

TEST_CASE("ContactBook: resolves phone numbers in any format", "[contacts]") {
    auto book = sample_book();
    REQUIRE(book.resolve_name("+15551234567") == "Alice Smith");
    REQUIRE(book.resolve_name("5551234567") == "Alice Smith");
    REQUIRE(book.resolve_name("+1 555 987 6543") == "Bob Jones");
}

TEST_CASE("ContactBook: resolves emails case-insensitively", "[contacts]") {
    auto book = sample_book();
    REQUIRE(book.resolve_name("carol@example.com") == "Carol White");
    REQUIRE(book.resolve_name("CAROL@EXAMPLE.COM") == "Carol White");
}

TEST_CASE("ContactBook: unknown handles come back unchanged", "[contacts]") {
    auto book = sample_book();
    REQUIRE(book.resolve_name("+15550000000") == "+15550000000");
    REQUIRE(book.resolve_name("dave@example.com") == "dave@example.com");
    REQUIRE(book.resolve_name("").empty());
}

TEST_CASE("ContactBook: empty book resolves nothing", "[contacts]") {
    ContactBook book;
    REQUIRE(book.empty());
    REQUIRE(book.resolve_name("+15551234567") == "+15551234567");
    REQUIRE(book.resolve_conversation_name("", {}, false) == "Unknown");
}

TEST_CASE("ContactBook: named conversation keeps its name", "[contacts]") {
    auto book = sample_book();
    REQUIRE(book.resolve_conversation_name("Family", {"+15551234567"}, true) == "Family");
}

TEST_CASE("ContactBook: direct conversation uses the participant name", "[contacts]") {
    auto book = sample_book();
    REQUIRE(book.resolve_conversation_name("+15551234567", {"+15551234567"}, false) ==
            "Alice Smith");
    REQUIRE(book.resolve_conversation_name("", {"+15550000000"}, false) == "+15550000000");
}

TEST_CASE("ContactBook: group name lists at most four participants", "[contacts]") {
    auto book = sample_book();
    std::vector<std::string> handles = {"+15551234567", "5559876543", "carol@example.com",
                                        "+15550000001", "+15550000002"};
    REQUIRE(book.resolve_conversation_name("chat123", handles, true) ==
            "Alice Smith, Bob Jones, Carol White, +15550000001...");

    handles.resize(2);
    REQUIRE(book.resolve_conversation_name("chat123", handles, true) == "Alice Smith, Bob Jones");
}

TEST_CASE("ContactBook: six participants render four names and an ellipsis", "[contacts]") {
    ContactBook book;
    std::vector<std::string> handles;
    for (int i = 1; i <= 6; ++i) {
        std::string email = "p" + std::to_string(i) + "@example.com";
        book.add_email(email, "Person " + std::to_string(i));
        handles.push_back(email);
    }
    REQUIRE(book.resolve_conversation_name("", handles, true) ==
            "Person 1, Person 2, Person 3, Person 4...");
}

TEST_CASE("ContactBook: no handles falls back to the identifier", "[contacts]") {
    auto book = sample_book();
    REQUIRE(book.resolve_conversation_name("+15551234567", {}, false) == "Alice Smith");
    REQUIRE(book.resolve_conversation_name("chat999", {}, true) == "chat999");
}

// ── AddressBook databases ────────────────────────────────────────

struct AddressBookFixture {
    fs::path root = fs::temp_directory_path() /
                    ("onthisday_test_addressbook_" + std::to_string(getpid()));

    AddressBookFixture() {
        fs::remove_all(root);
        fs::create_directories(root / "Sources");
    }
    ~AddressBookFixture() { fs::remove_all(root); }

    static void exec(sqlite3* db, const std::string& sql) {
        char* err = nullptr;
        if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw std::runtime_error(msg);
        }
    }

    // Creates an AddressBook database with the given statements run after
    // the schema.
    std::string create(const fs::path& dir, const std::string& inserts, bool with_schema = true) {
        fs::create_directories(dir);
        std::string path = (dir / "AddressBook-v22.abcddb").string();
        sqlite3* db = nullptr;
        sqlite3_open(path.c_str(), &db);
        if (with_schema) {
            exec(db,
                 "CREATE TABLE ZABCDRECORD (Z_PK INTEGER PRIMARY KEY, ZFIRSTNAME TEXT, "
                 "  ZLASTNAME TEXT, ZORGANIZATION TEXT);"
                 "CREATE TABLE ZABCDPHONENUMBER (Z_PK INTEGER PRIMARY KEY, ZOWNER INTEGER, "
                 "  ZFULLNUMBER TEXT);"
                 "CREATE TABLE ZABCDEMAILADDRESS (Z_PK INTEGER PRIMARY KEY, ZOWNER INTEGER, "
                 "  ZADDRESS TEXT);");
        }
        exec(db, inserts);
        sqlite3_close(db);
        return path;
    }
};

TEST_CASE("find_address_books: sources sorted, then the main database", "[contacts]") {
    AddressBookFixture f;
    f.create(f.root / "Sources" / "BBB", "");
    f.create(f.root / "Sources" / "AAA", "");
    f.create(f.root, "");
    fs::create_directories(f.root / "Sources" / "EMPTY");

    auto paths = find_address_books(f.root.string());
    REQUIRE(paths.size() == 3);
    REQUIRE(paths[0] == (f.root / "Sources" / "AAA" / "AddressBook-v22.abcddb").string());
    REQUIRE(paths[1] == (f.root / "Sources" / "BBB" / "AddressBook-v22.abcddb").string());
    REQUIRE(paths[2] == (f.root / "AddressBook-v22.abcddb").string());
}

TEST_CASE("find_address_books: missing root yields nothing", "[contacts]") {
    REQUIRE(find_address_books("/nonexistent/onthisday/addressbook").empty());
}

TEST_CASE("load_address_books: reads phones and emails", "[contacts]") {
    AddressBookFixture f;
    auto path = f.create(f.root / "Sources" / "AAA",
        "INSERT INTO ZABCDRECORD VALUES (1, 'Alice', 'Smith', NULL);"
        "INSERT INTO ZABCDRECORD VALUES (2, 'Bob', NULL, NULL);"
        "INSERT INTO ZABCDRECORD VALUES (3, NULL, NULL, 'Acme');"
        "INSERT INTO ZABCDPHONENUMBER VALUES (1, 1, '+1 (555) 123-4567');"
        "INSERT INTO ZABCDPHONENUMBER VALUES (2, 3, '+1 555 000 1111');"
        "INSERT INTO ZABCDEMAILADDRESS VALUES (1, 2, 'Bob@Example.com');");

    auto book = load_address_books({path});
    REQUIRE(book.size() == 2);
    REQUIRE(book.resolve_name("+15551234567") == "Alice Smith");
    REQUIRE(book.resolve_name("bob@example.com") == "Bob");
    REQUIRE(book.resolve_name("+15550001111") == "+15550001111");
}

TEST_CASE("load_address_books: skips unreadable databases", "[contacts]") {
    AddressBookFixture f;
    auto good = f.create(f.root / "Sources" / "AAA",
        "INSERT INTO ZABCDRECORD VALUES (1, 'Alice', 'Smith', NULL);"
        "INSERT INTO ZABCDPHONENUMBER VALUES (1, 1, '5551234567');");
    auto no_tables = f.create(f.root / "Sources" / "BBB", "CREATE TABLE unrelated (x);", false);

    auto book = load_address_books({no_tables, "/nonexistent/AddressBook-v22.abcddb", good});
    REQUIRE(book.size() == 1);
    REQUIRE(book.resolve_name("+15551234567") == "Alice Smith");
}

// ── ContactCache ─────────────────────────────────────────────────

TEST_CASE("ContactCache: loads once", "[contacts]") {
    int loads = 0;
    ContactCache cache([&loads]() {
        ++loads;
        ContactBook book;
        book.add_email("a@example.com", "A");
        return book;
    });

    REQUIRE(cache.get().resolve_name("a@example.com") == "A");
    REQUIRE(cache.get().size() == 1);
    REQUIRE(loads == 1);
}

TEST_CASE("ContactCache: concurrent first use loads once", "[contacts]") {
    std::atomic<int> loads{0};
    ContactCache cache([&loads]() {
        ++loads;
        return ContactBook{};
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&cache]() { cache.get(); });
    }
    for (auto& t : threads) t.join();
    REQUIRE(loads.load() == 1);
}

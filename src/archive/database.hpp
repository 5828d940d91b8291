#pragma once
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

struct sqlite3;      // forward declare
struct sqlite3_stmt; // forward declare

namespace onthisday {

// Any failure talking to a store: open, prepare (missing table/column), step.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Statement;

// Scoped read-only connection. Closed on destruction.
class Database {
public:
    explicit Database(const std::string& path);
    ~Database();

    // Non-copyable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Statement prepare(const std::string& sql) const;

    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

// Column access for the current row, by result column name (or alias).
class Row {
public:
    std::optional<std::string> text(const std::string& column) const;
    std::optional<int64_t> integer(const std::string& column) const;
    std::optional<std::vector<uint8_t>> blob(const std::string& column) const;
    bool is_null(const std::string& column) const;

private:
    friend class Statement;
    Row(sqlite3_stmt* stmt, const std::unordered_map<std::string, int>* columns)
        : stmt_(stmt), columns_(columns) {}

    int index_of(const std::string& column) const;

    sqlite3_stmt* stmt_;
    const std::unordered_map<std::string, int>* columns_;
};

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&&) = delete;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Parameters are 1-based, as in sqlite3_bind_*.
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, const std::string& value);

    // Advance to the next row. Returns false when done, throws StoreError on error.
    bool step();

    Row row() const { return Row(stmt_, &columns_); }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::unordered_map<std::string, int> columns_;
};

// Run fn; if the store fails, log and return fallback instead.
template <typename T, typename Fn>
T or_default(const std::string& what, T fallback, Fn&& fn) {
    try {
        return fn();
    } catch (const StoreError& e) {
        std::cerr << "[store] " << what << " failed: " << e.what() << "\n";
        return fallback;
    }
}

} // namespace onthisday

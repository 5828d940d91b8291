#include "database.hpp"
#include <sqlite3.h>

namespace onthisday {

Database::Database(const std::string& path) : path_(path) {
    if (sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError("failed to open " + path_ + ": " + err);
    }
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Statement Database::prepare(const std::string& sql) const {
    return Statement(db_, sql);
}

// ── Statement ────────────────────────────────────────────────

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        std::string err = sqlite3_errmsg(db_);
        if (stmt_) {
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
        throw StoreError(err);
    }
    int n = sqlite3_column_count(stmt_);
    for (int i = 0; i < n; ++i) {
        if (const char* name = sqlite3_column_name(stmt_, i)) {
            columns_.emplace(name, i);
        }
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_), columns_(std::move(other.columns_)) {
    other.stmt_ = nullptr;
}

Statement& Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        throw StoreError(sqlite3_errmsg(db_));
    }
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw StoreError(sqlite3_errmsg(db_));
    }
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StoreError(sqlite3_errmsg(db_));
}

// ── Row ──────────────────────────────────────────────────────

int Row::index_of(const std::string& column) const {
    auto it = columns_->find(column);
    if (it == columns_->end()) {
        throw StoreError("no result column named " + column);
    }
    return it->second;
}

bool Row::is_null(const std::string& column) const {
    return sqlite3_column_type(stmt_, index_of(column)) == SQLITE_NULL;
}

std::optional<std::string> Row::text(const std::string& column) const {
    int i = index_of(column);
    if (sqlite3_column_type(stmt_, i) == SQLITE_NULL) return std::nullopt;
    const auto* v = sqlite3_column_text(stmt_, i);
    if (!v) return std::nullopt;
    int n = sqlite3_column_bytes(stmt_, i);
    return std::string(reinterpret_cast<const char*>(v), static_cast<size_t>(n));
}

std::optional<int64_t> Row::integer(const std::string& column) const {
    int i = index_of(column);
    if (sqlite3_column_type(stmt_, i) == SQLITE_NULL) return std::nullopt;
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, i));
}

std::optional<std::vector<uint8_t>> Row::blob(const std::string& column) const {
    int i = index_of(column);
    if (sqlite3_column_type(stmt_, i) == SQLITE_NULL) return std::nullopt;
    const auto* v = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, i));
    int n = sqlite3_column_bytes(stmt_, i);
    if (!v || n <= 0) return std::vector<uint8_t>{};
    return std::vector<uint8_t>(v, v + n);
}

} // namespace onthisday

/**
 * tabsql/database.hpp - RAII SQLite database wrapper with parameterized queries
 *
 * Part of tabsql - a schema-versioned JSON table store on SQLite.
 *
 * Example usage:
 *
 *   tabsql::Database db;
 *   auto st = db.open(":memory:");
 *   if (!st.ok()) {
 *       fprintf(stderr, "Error: %s\n", st.error.c_str());
 *       return 1;
 *   }
 *
 *   db.execute("CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT)");
 *   db.execute("INSERT INTO users (name) VALUES (?)", {std::string("Alice")});
 *
 *   auto result = db.query("SELECT id, name FROM users WHERE id > ?", {int64_t(0)});
 *   if (!result.ok()) {
 *       fprintf(stderr, "Query error: %s\n", result.error.c_str());
 *       return 1;
 *   }
 *
 *   for (const auto& row : result) {
 *       printf("%s\n", tabsql::to_string(row[1]).c_str());
 *   }
 */

#pragma once

#include "errors.hpp"

#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tabsql {

// ============================================================================
// Storage Values
// ============================================================================

/// One SQLite cell: NULL, INTEGER, REAL or TEXT.
using Value = std::variant<std::monostate, int64_t, double, std::string>;

inline bool is_null(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

inline std::string to_string(const Value& v) {
    if (auto* i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (auto* d = std::get_if<double>(&v)) return std::to_string(*d);
    if (auto* s = std::get_if<std::string>(&v)) return *s;
    return "NULL";
}

// ============================================================================
// Query Result Types
// ============================================================================

struct Row {
    std::vector<Value> values;

    const Value& operator[](size_t i) const { return values[i]; }
    Value& operator[](size_t i) { return values[i]; }
    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
};

struct Result {
    std::vector<std::string> columns;
    std::vector<Row> rows;
    std::string error;
    ErrorCode code = ErrorCode::Ok;
    int sqlite_code = SQLITE_OK;

    bool ok() const { return code == ErrorCode::Ok; }
    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }

    const Row& operator[](size_t i) const { return rows[i]; }

    Status status() const { return ok() ? Status::success() : Status::fail(code, error); }

    // Iterator support
    auto begin() { return rows.begin(); }
    auto end() { return rows.end(); }
    auto begin() const { return rows.begin(); }
    auto end() const { return rows.end(); }
};

struct ExecResult {
    int64_t changes = 0;
    int64_t last_insert_rowid = 0;
    std::string error;
    ErrorCode code = ErrorCode::Ok;
    int sqlite_code = SQLITE_OK;

    bool ok() const { return code == ErrorCode::Ok; }

    Status status() const { return ok() ? Status::success() : Status::fail(code, error); }
};

// ============================================================================
// Database Wrapper
// ============================================================================

class Database {
public:
    Database() = default;

    /**
     * Constructor with explicit path; check is_open() afterwards
     */
    explicit Database(const std::string& path) { (void)open(path); }
    ~Database() { if (db_) sqlite3_close(db_); }

    // Non-copyable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Movable
    Database(Database&& other) noexcept
        : db_(other.db_), path_(std::move(other.path_)),
          last_error_(std::move(other.last_error_)) {
        other.db_ = nullptr;
    }

    Database& operator=(Database&& other) noexcept {
        if (this != &other) {
            if (db_) sqlite3_close(db_);
            db_ = other.db_;
            path_ = std::move(other.path_);
            last_error_ = std::move(other.last_error_);
            other.db_ = nullptr;
        }
        return *this;
    }

    static Database in_memory() {
        Database db;
        (void)db.open(":memory:");
        return db;
    }

    // ========================================================================
    // Open/Close
    // ========================================================================

    Status open(const std::string& path = ":memory:") {
        if (db_) {
            return fail(ErrorCode::AlreadyOpen, "Database is already open");
        }
        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "Failed to allocate database";
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            return fail(ErrorCode::StorageError, msg);
        }
        sqlite3_extended_result_codes(db_, 1);
        path_ = path;
        last_error_.clear();
        return Status::success();
    }

    Status close() {
        if (!db_) {
            return fail(ErrorCode::NotOpen, "Database is not open");
        }
        sqlite3_close(db_);
        db_ = nullptr;
        path_.clear();
        return Status::success();
    }

    bool is_open() const { return db_ != nullptr; }
    const std::string& path() const { return path_; }

    // ========================================================================
    // Statement Execution
    // ========================================================================

    /**
     * Run a single statement that returns no rows.
     */
    ExecResult execute(const std::string& sql, const std::vector<Value>& params = {}) {
        ExecResult result;

        StmtPtr stmt = prepare(sql, params, result.code, result.sqlite_code, result.error);
        if (!stmt) return result;

        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        }
        if (rc != SQLITE_DONE) {
            set_error(result.code, result.sqlite_code, result.error);
            return result;
        }

        result.changes = sqlite3_changes(db_);
        result.last_insert_rowid = sqlite3_last_insert_rowid(db_);
        last_error_.clear();
        return result;
    }

    /**
     * Run a single statement and collect every row.
     */
    Result query(const std::string& sql, const std::vector<Value>& params = {}) {
        return run_query(sql, params, 0);
    }

    /**
     * Run a single statement and keep at most the first row.
     */
    Result query_one(const std::string& sql, const std::vector<Value>& params = {}) {
        return run_query(sql, params, 1);
    }

    /**
     * Get single value (first column of first row), NULL when absent
     */
    Value scalar(const std::string& sql, const std::vector<Value>& params = {}) {
        auto result = query_one(sql, params);
        if (result.ok() && !result.empty() && !result[0].empty()) {
            return result[0][0];
        }
        return Value{};
    }

    /**
     * Run a script of one or more statements without parameters.
     */
    int exec(const char* sql) {
        if (!db_) {
            last_error_ = "Database is not open";
            return SQLITE_MISUSE;
        }

        char* err = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
        if (err) {
            last_error_ = err;
            sqlite3_free(err);
        } else if (rc != SQLITE_OK) {
            last_error_ = sqlite3_errmsg(db_);
        } else {
            last_error_.clear();
        }
        return rc;
    }

    int exec(const std::string& sql) {
        return exec(sql.c_str());
    }

    /**
     * Run fn between BEGIN and COMMIT. A failed Status from fn rolls back
     * and is returned unchanged.
     */
    template<typename Fn>
    Status transaction(Fn&& fn) {
        if (!db_) {
            return fail(ErrorCode::NotOpen, "Database is not open");
        }
        if (exec("BEGIN") != SQLITE_OK) {
            return Status::fail(ErrorCode::StorageError, last_error_);
        }
        Status st = fn();
        if (!st.ok()) {
            return rollback(std::move(st));
        }
        if (exec("COMMIT") != SQLITE_OK) {
            return rollback(Status::fail(ErrorCode::StorageError, last_error_));
        }
        return st;
    }

    // ========================================================================
    // Direct Access
    // ========================================================================

    sqlite3* handle() const { return db_; }
    const std::string& last_error() const { return last_error_; }

    // ========================================================================
    // Utility
    // ========================================================================

    int64_t last_insert_rowid() const {
        return db_ ? sqlite3_last_insert_rowid(db_) : 0;
    }

private:
    using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    // Returns cause, with the ROLLBACK error appended if the rollback failed
    // too. The connection then stays inside the transaction.
    Status rollback(Status cause) {
        if (sqlite3_get_autocommit(db_)) return cause;
        if (exec("ROLLBACK") != SQLITE_OK) {
            cause.error += "; rollback failed: " + last_error_;
        }
        return cause;
    }

    Status fail(ErrorCode code, const std::string& msg) {
        last_error_ = msg;
        return Status::fail(code, msg);
    }

    void set_error(ErrorCode& code, int& sqlite_code, std::string& error) {
        code = ErrorCode::StorageError;
        sqlite_code = sqlite3_extended_errcode(db_);
        error = sqlite3_errmsg(db_);
        last_error_ = error;
    }

    StmtPtr prepare(const std::string& sql, const std::vector<Value>& params,
                    ErrorCode& code, int& sqlite_code, std::string& error) {
        StmtPtr none(nullptr, &sqlite3_finalize);
        if (!db_) {
            code = ErrorCode::NotOpen;
            sqlite_code = SQLITE_MISUSE;
            error = "Database is not open";
            last_error_ = error;
            return none;
        }

        sqlite3_stmt* raw = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
        StmtPtr stmt(raw, &sqlite3_finalize);
        if (rc != SQLITE_OK) {
            set_error(code, sqlite_code, error);
            return none;
        }

        for (size_t i = 0; i < params.size(); ++i) {
            if (bind(stmt.get(), static_cast<int>(i + 1), params[i]) != SQLITE_OK) {
                set_error(code, sqlite_code, error);
                return none;
            }
        }
        return stmt;
    }

    static int bind(sqlite3_stmt* stmt, int idx, const Value& v) {
        if (auto* i = std::get_if<int64_t>(&v)) {
            return sqlite3_bind_int64(stmt, idx, *i);
        }
        if (auto* d = std::get_if<double>(&v)) {
            return sqlite3_bind_double(stmt, idx, *d);
        }
        if (auto* s = std::get_if<std::string>(&v)) {
            return sqlite3_bind_text(stmt, idx, s->data(), static_cast<int>(s->size()),
                                     SQLITE_TRANSIENT);
        }
        return sqlite3_bind_null(stmt, idx);
    }

    static Value column_value(sqlite3_stmt* stmt, int col) {
        switch (sqlite3_column_type(stmt, col)) {
            case SQLITE_INTEGER:
                return Value{static_cast<int64_t>(sqlite3_column_int64(stmt, col))};
            case SQLITE_FLOAT:
                return Value{sqlite3_column_double(stmt, col)};
            case SQLITE_TEXT:
            case SQLITE_BLOB: {
                const char* text = static_cast<const char*>(sqlite3_column_blob(stmt, col));
                int bytes = sqlite3_column_bytes(stmt, col);
                return Value{std::string(text ? text : "", text ? bytes : 0)};
            }
            default:
                return Value{};
        }
    }

    Result run_query(const std::string& sql, const std::vector<Value>& params, size_t limit) {
        Result result;

        StmtPtr stmt = prepare(sql, params, result.code, result.sqlite_code, result.error);
        if (!stmt) return result;

        // Get column names
        int col_count = sqlite3_column_count(stmt.get());
        result.columns.reserve(col_count);
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt.get(), i);
            result.columns.push_back(name ? name : "");
        }

        // Fetch rows
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            Row row;
            row.values.reserve(col_count);
            for (int i = 0; i < col_count; ++i) {
                row.values.push_back(column_value(stmt.get(), i));
            }
            result.rows.push_back(std::move(row));
            if (limit > 0 && result.rows.size() >= limit) {
                rc = SQLITE_DONE;
                break;
            }
        }

        if (rc != SQLITE_DONE) {
            set_error(result.code, result.sqlite_code, result.error);
        } else {
            last_error_.clear();
        }
        return result;
    }

    sqlite3* db_ = nullptr;
    std::string path_;
    std::string last_error_;
};

} // namespace tabsql

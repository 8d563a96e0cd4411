/**
 * tabsql/errors.hpp - Error codes and status values
 *
 * Part of tabsql - a schema-versioned JSON table store on SQLite.
 *
 * Errors are returned, not thrown. Every fallible operation yields a Status
 * (or an Outcome<T> carrying a value plus a Status):
 *
 *   auto st = store.write(tables);
 *   if (!st.ok()) {
 *       fprintf(stderr, "%s: %s\n", tabsql::error_code_name(st.code), st.error.c_str());
 *       for (const auto& d : st.details) fprintf(stderr, "  %s\n", d.c_str());
 *   }
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace tabsql {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Ok,
    TableNotFound,
    ColumnNotFound,
    SchemaIncompatible,
    UnsupportedColumnType,
    UnsupportedValue,
    UnsupportedPredicateType,
    AggregateWriteError,
    NotReady,
    AlreadyOpen,
    NotOpen,
    InvalidKey,
    HashMismatch,
    StorageError
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                       return "Ok";
        case ErrorCode::TableNotFound:            return "TableNotFound";
        case ErrorCode::ColumnNotFound:           return "ColumnNotFound";
        case ErrorCode::SchemaIncompatible:       return "SchemaIncompatible";
        case ErrorCode::UnsupportedColumnType:    return "UnsupportedColumnType";
        case ErrorCode::UnsupportedValue:         return "UnsupportedValue";
        case ErrorCode::UnsupportedPredicateType: return "UnsupportedPredicateType";
        case ErrorCode::AggregateWriteError:      return "AggregateWriteError";
        case ErrorCode::NotReady:                 return "NotReady";
        case ErrorCode::AlreadyOpen:              return "AlreadyOpen";
        case ErrorCode::NotOpen:                  return "NotOpen";
        case ErrorCode::InvalidKey:               return "InvalidKey";
        case ErrorCode::HashMismatch:             return "HashMismatch";
        case ErrorCode::StorageError:             return "StorageError";
    }
    return "Unknown";
}

// ============================================================================
// Status
// ============================================================================

struct Status {
    ErrorCode code = ErrorCode::Ok;
    std::string error;
    std::vector<std::string> details;  // Per-item messages of an aggregate failure

    bool ok() const { return code == ErrorCode::Ok; }

    static Status success() { return Status(); }

    static Status fail(ErrorCode c, std::string msg) {
        Status s;
        s.code = c;
        s.error = std::move(msg);
        return s;
    }
};

// ============================================================================
// Outcome - value or failure
// ============================================================================

template<typename T>
struct Outcome {
    T value{};
    Status status;

    bool ok() const { return status.ok(); }
    const std::string& error() const { return status.error; }
    ErrorCode code() const { return status.code; }

    static Outcome of(T v) {
        Outcome o;
        o.value = std::move(v);
        return o;
    }

    static Outcome fail(Status s) {
        Outcome o;
        o.status = std::move(s);
        return o;
    }

    static Outcome fail(ErrorCode c, std::string msg) {
        return fail(Status::fail(c, std::move(msg)));
    }
};

} // namespace tabsql

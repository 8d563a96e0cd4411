/**
 * tabsql/types.hpp - Core types for the tabsql table model
 *
 * Part of tabsql - a schema-versioned JSON table store on SQLite.
 */

#pragma once

#include "errors.hpp"
#include "json.hpp"

#include <map>
#include <string>
#include <vector>

namespace tabsql {

// ============================================================================
// Column Types
// ============================================================================

enum class ColumnType {
    String,
    Number,
    Boolean,
    Json,
    JsonArray
};

inline const char* column_type_name(ColumnType t) {
    switch (t) {
        case ColumnType::String:    return "string";
        case ColumnType::Number:    return "number";
        case ColumnType::Boolean:   return "boolean";
        case ColumnType::Json:      return "json";
        case ColumnType::JsonArray: return "jsonArray";
    }
    return "string";
}

inline const char* column_type_sql(ColumnType t) {
    switch (t) {
        case ColumnType::String:    return "TEXT";
        case ColumnType::Number:    return "REAL";
        case ColumnType::Boolean:   return "INTEGER";
        case ColumnType::Json:      return "TEXT";
        case ColumnType::JsonArray: return "TEXT";
    }
    return "TEXT";
}

inline Outcome<ColumnType> parse_column_type(const std::string& name) {
    static const ColumnType all[] = {
        ColumnType::String, ColumnType::Number, ColumnType::Boolean,
        ColumnType::Json, ColumnType::JsonArray
    };
    for (ColumnType t : all) {
        if (name == column_type_name(t)) return Outcome<ColumnType>::of(t);
    }
    return Outcome<ColumnType>::fail(ErrorCode::UnsupportedColumnType,
                                     "Unsupported column type " + name);
}

// ============================================================================
// Table Configuration
// ============================================================================

struct ColumnConfig {
    std::string key;
    ColumnType type = ColumnType::String;

    bool operator==(const ColumnConfig& o) const { return key == o.key && type == o.type; }
    bool operator!=(const ColumnConfig& o) const { return !(*this == o); }
};

struct TableConfig {
    std::string key;
    std::string type;
    std::vector<ColumnConfig> columns;
    std::string hash;

    const ColumnConfig* find_column(const std::string& column_key) const {
        for (const auto& c : columns) {
            if (c.key == column_key) return &c;
        }
        return nullptr;
    }

    bool has_column(const std::string& column_key) const {
        return find_column(column_key) != nullptr;
    }

    /**
     * Columns as stored: the row hash column first (unless declared
     * explicitly), then every declared column in order.
     */
    std::vector<ColumnConfig> storage_columns() const {
        std::vector<ColumnConfig> out;
        out.reserve(columns.size() + 1);
        if (!has_column(kHashField)) {
            out.push_back({kHashField, ColumnType::String});
        }
        out.insert(out.end(), columns.begin(), columns.end());
        return out;
    }

    std::vector<std::string> storage_column_keys() const {
        std::vector<std::string> keys;
        for (const auto& c : storage_columns()) keys.push_back(c.key);
        return keys;
    }
};

inline void to_json(json& j, const ColumnConfig& c) {
    j = json{{"key", c.key}, {"type", column_type_name(c.type)}};
}

inline void to_json(json& j, const TableConfig& cfg) {
    j = json{{"key", cfg.key}, {"type", cfg.type}, {"columns", cfg.columns}};
    if (!cfg.hash.empty()) j[kHashField] = cfg.hash;
}

inline Outcome<std::vector<ColumnConfig>> columns_from_json(const json& j) {
    using R = Outcome<std::vector<ColumnConfig>>;
    if (!j.is_array()) {
        return R::fail(ErrorCode::UnsupportedValue, "columns must be an array");
    }
    std::vector<ColumnConfig> columns;
    for (const auto& c : j) {
        if (!c.is_object() || !c.contains("key") || !c["key"].is_string() ||
            !c.contains("type") || !c["type"].is_string()) {
            return R::fail(ErrorCode::UnsupportedValue, "Malformed column config " + c.dump());
        }
        auto type = parse_column_type(c["type"].get<std::string>());
        if (!type.ok()) return R::fail(type.status);
        columns.push_back({c["key"].get<std::string>(), type.value});
    }
    return R::of(std::move(columns));
}

inline Outcome<TableConfig> table_config_from_json(const json& j) {
    using R = Outcome<TableConfig>;
    if (!j.is_object() || !j.contains("key") || !j["key"].is_string() ||
        !j.contains("type") || !j["type"].is_string() || !j.contains("columns")) {
        return R::fail(ErrorCode::UnsupportedValue, "Malformed table config");
    }
    auto columns = columns_from_json(j["columns"]);
    if (!columns.ok()) return R::fail(columns.status);

    TableConfig cfg;
    cfg.key = j["key"].get<std::string>();
    cfg.type = j["type"].get<std::string>();
    cfg.columns = std::move(columns.value);
    if (j.contains(kHashField) && j[kHashField].is_string()) {
        cfg.hash = j[kHashField].get<std::string>();
    }
    return R::of(std::move(cfg));
}

// ============================================================================
// Tables
// ============================================================================

/// Rows are sparse JSON objects: absent keys carry no value.
struct Table {
    std::string type;
    std::vector<json> data;
    std::string table_config_hash;
    std::string hash;

    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
};

inline void to_json(json& j, const Table& t) {
    j = json{{"type", t.type}, {"data", t.data}};
    if (!t.table_config_hash.empty()) j["tableConfigHash"] = t.table_config_hash;
    if (!t.hash.empty()) j[kHashField] = t.hash;
}

inline Outcome<Table> table_from_json(const json& j) {
    using R = Outcome<Table>;
    if (!j.is_object() || !j.contains("data") || !j["data"].is_array()) {
        return R::fail(ErrorCode::UnsupportedValue, "Malformed table: data must be an array");
    }
    Table t;
    if (j.contains("type") && j["type"].is_string()) t.type = j["type"].get<std::string>();
    if (j.contains("tableConfigHash") && j["tableConfigHash"].is_string()) {
        t.table_config_hash = j["tableConfigHash"].get<std::string>();
    }
    if (j.contains(kHashField) && j[kHashField].is_string()) {
        t.hash = j[kHashField].get<std::string>();
    }
    for (const auto& row : j["data"]) {
        t.data.push_back(row);
    }
    return R::of(std::move(t));
}

/// Every table of a store, keyed by logical table key.
struct Dump {
    std::map<std::string, Table> tables;
    std::string hash;
};

inline void to_json(json& j, const Dump& d) {
    j = json::object();
    for (const auto& [key, table] : d.tables) {
        j[key] = table;
    }
    if (!d.hash.empty()) j[kHashField] = d.hash;
}

} // namespace tabsql

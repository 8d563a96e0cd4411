/**
 * tabsql/query_translator.hpp - Parameterized SQL built from table configs
 *
 * Part of tabsql - a schema-versioned JSON table store on SQLite.
 *
 * Every function here is pure. Identifiers come from validated logical keys
 * passed through NameMapper; every value travels as a bound parameter.
 */

#pragma once

#include "column_codec.hpp"
#include "database.hpp"
#include "name_mapper.hpp"
#include "types.hpp"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace tabsql {

struct Statement {
    std::string sql;
    std::vector<Value> params;
};

/// Column key and the value it must equal.
using Predicate = std::pair<std::string, json>;

class QueryTranslator {
public:
    static Statement create_table(const TableConfig& cfg) {
        std::ostringstream ss;
        ss << "CREATE TABLE IF NOT EXISTS " << NameMapper::to_physical_table(cfg.key) << " (";
        auto columns = cfg.storage_columns();
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << NameMapper::to_physical_column(columns[i].key) << " "
               << column_type_sql(columns[i].type);
            if (columns[i].key == kHashField) ss << " PRIMARY KEY";
        }
        ss << ")";
        return {ss.str(), {}};
    }

    static std::vector<Statement> alter_table(const std::string& table_key,
                                              const std::vector<ColumnConfig>& added) {
        std::vector<Statement> out;
        out.reserve(added.size());
        for (const auto& c : added) {
            out.push_back({"ALTER TABLE " + NameMapper::to_physical_table(table_key) +
                           " ADD COLUMN " + NameMapper::to_physical_column(c.key) + " " +
                           column_type_sql(c.type), {}});
        }
        return out;
    }

    /**
     * INSERT OR IGNORE: a row whose primary key exists is left untouched.
     */
    static Statement insert_row(const std::string& table_key,
                                const std::vector<std::string>& column_keys,
                                std::vector<Value> values) {
        std::ostringstream ss;
        ss << "INSERT OR IGNORE INTO " << NameMapper::to_physical_table(table_key) << " ("
           << column_list(column_keys) << ") VALUES (";
        for (size_t i = 0; i < column_keys.size(); ++i) {
            ss << (i > 0 ? ", ?" : "?");
        }
        ss << ")";
        return {ss.str(), std::move(values)};
    }

    static Statement select_all(const std::string& table_key,
                                const std::vector<std::string>& column_keys) {
        return {"SELECT " + column_list(column_keys) + " FROM " +
                NameMapper::to_physical_table(table_key) + " ORDER BY rowid", {}};
    }

    static Outcome<Statement> select_where(const std::string& table_key,
                                           const std::vector<std::string>& column_keys,
                                           const std::vector<Predicate>& predicates) {
        Statement stmt;
        std::ostringstream where;
        for (const auto& [column, value] : predicates) {
            std::string col = NameMapper::to_physical_column(column);
            if (where.tellp() > 0) where << " AND ";

            if (value.is_null()) {
                where << col << " IS NULL";
                continue;
            }
            where << col << " = ?";
            if (value.is_string()) {
                stmt.params.push_back(value.get<std::string>());
            } else if (value.is_boolean()) {
                stmt.params.push_back(static_cast<int64_t>(value.get<bool>() ? 1 : 0));
            } else if (value.is_number()) {
                auto encoded = ColumnCodec::encode(value, ColumnType::Number);
                if (!encoded.ok()) return Outcome<Statement>::fail(encoded.status);
                stmt.params.push_back(std::move(encoded.value));
            } else if (value.is_object() || value.is_array()) {
                stmt.params.push_back(value.dump());
            } else {
                return Outcome<Statement>::fail(
                    ErrorCode::UnsupportedPredicateType,
                    std::string("Unsupported value type ") + value.type_name() +
                    " for column " + column);
            }
        }

        stmt.sql = "SELECT " + column_list(column_keys) + " FROM " +
                   NameMapper::to_physical_table(table_key);
        if (where.tellp() > 0) stmt.sql += " WHERE " + where.str();
        stmt.sql += " ORDER BY rowid";
        return Outcome<Statement>::of(std::move(stmt));
    }

    static Statement count_rows(const std::string& table_key) {
        return {"SELECT COUNT(*) FROM " + NameMapper::to_physical_table(table_key), {}};
    }

    static Statement table_exists(const std::string& table_key) {
        return {"SELECT name FROM sqlite_master WHERE type = 'table' AND name = ?",
                {NameMapper::to_physical_table(table_key)}};
    }

    /**
     * One row per physical column; the column name is at index 1.
     */
    static Statement table_columns(const std::string& table_key) {
        return {"PRAGMA table_info(" + NameMapper::to_physical_table(table_key) + ")", {}};
    }

    // ========================================================================
    // Registry reads. registry_columns are the registry table's own keys.
    // ========================================================================

    static Statement read_registered_config(const std::vector<std::string>& registry_columns,
                                            const std::string& table_key) {
        return {registry_select(registry_columns) + " WHERE " +
                NameMapper::to_physical_column("key") + " = ? ORDER BY rowid DESC LIMIT 1",
                {table_key}};
    }

    static Statement config_history(const std::vector<std::string>& registry_columns,
                                    const std::string& table_key) {
        return {registry_select(registry_columns) + " WHERE " +
                NameMapper::to_physical_column("key") + " = ? ORDER BY rowid",
                {table_key}};
    }

    static Statement all_configs(const std::vector<std::string>& registry_columns) {
        return {registry_select(registry_columns) + " ORDER BY rowid", {}};
    }

    static Statement registered_keys() {
        std::string key_col = NameMapper::to_physical_column("key");
        return {"SELECT " + key_col + " FROM " +
                NameMapper::to_physical_table(NameMapper::kRegistryTable) +
                " GROUP BY " + key_col + " ORDER BY MIN(rowid)", {}};
    }

private:
    static std::string column_list(const std::vector<std::string>& column_keys) {
        std::string out;
        for (size_t i = 0; i < column_keys.size(); ++i) {
            if (i > 0) out += ", ";
            out += NameMapper::to_physical_column(column_keys[i]);
        }
        return out;
    }

    static std::string registry_select(const std::vector<std::string>& registry_columns) {
        return "SELECT " + column_list(registry_columns) + " FROM " +
               NameMapper::to_physical_table(NameMapper::kRegistryTable);
    }
};

} // namespace tabsql

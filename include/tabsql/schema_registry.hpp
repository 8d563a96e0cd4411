/**
 * tabsql/schema_registry.hpp - Append-only log of table configurations
 *
 * Part of tabsql - a schema-versioned JSON table store on SQLite.
 *
 * Every TableConfig version is a row of the registry table (tableCfgs_tbl),
 * keyed by the config's content hash. The newest row for a table key is the
 * active version; older rows stay readable through config_history().
 *
 * Evolution is additive only:
 *
 *   Unregistered --register--> v1 --extend--> v2 --extend--> ...
 *
 * A new version must keep every active column, in order and with the same
 * type, and may only append. The registry row is written before the table
 * is created or altered, inside one transaction; column additions skip
 * columns already present, so a retried migration converges.
 */

#pragma once

#include "column_codec.hpp"
#include "database.hpp"
#include "integrity.hpp"
#include "name_mapper.hpp"
#include "query_translator.hpp"
#include "types.hpp"

#include <set>
#include <string>
#include <vector>

namespace tabsql {

enum class SchemaChange {
    Unchanged,
    Created,
    Extended
};

class SchemaRegistry {
public:
    explicit SchemaRegistry(Database& db) : db_(db) {}

    // Non-copyable
    SchemaRegistry(const SchemaRegistry&) = delete;
    SchemaRegistry& operator=(const SchemaRegistry&) = delete;

    /**
     * The registry table's own configuration, registered by bootstrap().
     */
    static const TableConfig& registry_config() {
        return stamped_registry_config().value;
    }

    /**
     * Create the registry table and register its own config.
     */
    Status bootstrap() {
        const auto& stamped = stamped_registry_config();
        if (!stamped.ok()) return stamped.status;
        const TableConfig& cfg = stamped.value;
        return db_.transaction([&]() -> Status {
            Status st = db_.execute(QueryTranslator::create_table(cfg).sql).status();
            if (!st.ok()) return st;

            auto registered = is_registered(cfg.key);
            if (!registered.ok()) return registered.status;
            if (registered.value) return Status::success();
            return persist(cfg);
        });
    }

    /**
     * Register a new table or append columns to a registered one.
     */
    Outcome<SchemaChange> register_or_extend(const TableConfig& requested) {
        using R = Outcome<SchemaChange>;

        Status st = validate(requested);
        if (!st.ok()) return R::fail(st);

        TableConfig cfg = requested;
        cfg.hash.clear();
        auto hash = IntegrityEngine::hash_of(json(cfg));
        if (!hash.ok()) return R::fail(hash.status);
        cfg.hash = hash.value;

        auto active = active_config(cfg.key);
        if (!active.ok() && active.code() != ErrorCode::TableNotFound) {
            return R::fail(active.status);
        }

        if (!active.ok()) {
            st = check_unique_key(cfg.key);
            if (!st.ok()) return R::fail(st);
            st = db_.transaction([&]() -> Status {
                Status inner = persist(cfg);
                if (!inner.ok()) return inner;
                return db_.execute(QueryTranslator::create_table(cfg).sql).status();
            });
            if (!st.ok()) return R::fail(st);
            return R::of(SchemaChange::Created);
        }

        st = check_compatible(active.value, cfg);
        if (!st.ok()) return R::fail(st);

        std::vector<ColumnConfig> added(cfg.columns.begin() + active.value.columns.size(),
                                        cfg.columns.end());
        if (added.empty()) return R::of(SchemaChange::Unchanged);

        st = db_.transaction([&]() -> Status {
            Status inner = persist(cfg);
            if (!inner.ok()) return inner;
            return add_missing_columns(cfg.key, added);
        });
        if (!st.ok()) return R::fail(st);
        return R::of(SchemaChange::Extended);
    }

    /**
     * The active columns must be a prefix of next's columns, and the table
     * type must not change.
     */
    static Status check_compatible(const TableConfig& active, const TableConfig& next) {
        if (active.type != next.type) {
            return Status::fail(ErrorCode::SchemaIncompatible,
                                "Table " + next.key + " changes type from " + active.type +
                                " to " + next.type);
        }
        if (next.columns.size() < active.columns.size()) {
            return Status::fail(ErrorCode::SchemaIncompatible,
                                "Table " + next.key + " would lose columns");
        }
        for (size_t i = 0; i < active.columns.size(); ++i) {
            const auto& was = active.columns[i];
            const auto& now = next.columns[i];
            if (was != now) {
                return Status::fail(ErrorCode::SchemaIncompatible,
                                    "Table " + next.key + " column " + std::to_string(i) +
                                    " was " + was.key + ":" + column_type_name(was.type) +
                                    ", now " + now.key + ":" + column_type_name(now.type));
            }
        }
        return Status::success();
    }

    Outcome<TableConfig> active_config(const std::string& table_key) {
        using R = Outcome<TableConfig>;
        auto stmt = QueryTranslator::read_registered_config(registry_columns(), table_key);
        auto result = db_.query(stmt.sql, stmt.params);
        if (!result.ok()) return R::fail(result.status());
        if (result.empty()) {
            return R::fail(ErrorCode::TableNotFound, "Table " + table_key + " not found");
        }
        return config_from_row(result[0]);
    }

    /**
     * Every version of a table's config, oldest first.
     */
    Outcome<std::vector<TableConfig>> config_history(const std::string& table_key) {
        auto stmt = QueryTranslator::config_history(registry_columns(), table_key);
        auto out = read_configs(stmt);
        if (out.ok() && out.value.empty()) {
            return Outcome<std::vector<TableConfig>>::fail(
                ErrorCode::TableNotFound, "Table " + table_key + " not found");
        }
        return out;
    }

    /**
     * Every persisted version of every table, in registration order.
     */
    Outcome<std::vector<TableConfig>> all_configs() {
        return read_configs(QueryTranslator::all_configs(registry_columns()));
    }

    Outcome<std::vector<std::string>> registered_keys() {
        using R = Outcome<std::vector<std::string>>;
        auto result = db_.query(QueryTranslator::registered_keys().sql);
        if (!result.ok()) return R::fail(result.status());
        std::vector<std::string> keys;
        for (const auto& row : result) {
            if (auto* s = std::get_if<std::string>(&row[0])) keys.push_back(*s);
        }
        return R::of(std::move(keys));
    }

    Outcome<bool> is_registered(const std::string& table_key) {
        auto stmt = QueryTranslator::read_registered_config(registry_columns(), table_key);
        auto result = db_.query(stmt.sql, stmt.params);
        if (!result.ok()) return Outcome<bool>::fail(result.status());
        return Outcome<bool>::of(!result.empty());
    }

private:
    static const Outcome<TableConfig>& stamped_registry_config() {
        static const Outcome<TableConfig> cfg = [] {
            TableConfig c;
            c.key = NameMapper::kRegistryTable;
            c.type = "tableCfgs";
            c.columns = {
                {kHashField, ColumnType::String},
                {"key", ColumnType::String},
                {"type", ColumnType::String},
                {"columns", ColumnType::JsonArray},
            };
            auto hash = IntegrityEngine::hash_of(json(c));
            if (!hash.ok()) return Outcome<TableConfig>::fail(hash.status);
            c.hash = hash.value;
            return Outcome<TableConfig>::of(std::move(c));
        }();
        return cfg;
    }

    static const std::vector<std::string>& registry_columns() {
        static const std::vector<std::string> keys = registry_config().storage_column_keys();
        return keys;
    }

    static Status validate(const TableConfig& cfg) {
        Status st = NameMapper::validate_key(cfg.key);
        if (!st.ok()) return st;

        // Compared folded: "id" and "ID" are one SQLite column
        std::set<std::string> seen;
        for (const auto& c : cfg.columns) {
            st = NameMapper::validate_key(c.key);
            if (!st.ok()) return st;
            if (!seen.insert(NameMapper::fold(c.key)).second) {
                return Status::fail(ErrorCode::InvalidKey,
                                    "Duplicate column " + c.key + " in table " + cfg.key);
            }
            if (c.key == kHashField && c.type != ColumnType::String) {
                return Status::fail(ErrorCode::SchemaIncompatible,
                                    std::string("Column ") + kHashField + " must be a string");
            }
        }
        return Status::success();
    }

    /**
     * A new table key must not name the same physical table as a registered
     * key that differs only in case.
     */
    Status check_unique_key(const std::string& table_key) {
        auto keys = registered_keys();
        if (!keys.ok()) return keys.status;
        for (const auto& existing : keys.value) {
            if (NameMapper::same_identifier(existing, table_key)) {
                return Status::fail(ErrorCode::InvalidKey,
                                    "Table key " + table_key + " collides with " + existing);
            }
        }
        return Status::success();
    }

    Status persist(const TableConfig& cfg) {
        const TableConfig& registry = registry_config();
        json row = cfg;

        std::vector<Value> values;
        for (const auto& c : registry.storage_columns()) {
            auto encoded = ColumnCodec::encode(row.value(c.key, json()), c.type);
            if (!encoded.ok()) return encoded.status;
            values.push_back(std::move(encoded.value));
        }

        auto stmt = QueryTranslator::insert_row(registry.key, registry_columns(), std::move(values));
        return db_.execute(stmt.sql, stmt.params).status();
    }

    Status add_missing_columns(const std::string& table_key,
                               const std::vector<ColumnConfig>& added) {
        auto info = db_.query(QueryTranslator::table_columns(table_key).sql);
        if (!info.ok()) return info.status();

        std::set<std::string> present;
        for (const auto& row : info) {
            if (auto* name = std::get_if<std::string>(&row[1])) {
                present.insert(NameMapper::fold(*name));
            }
        }

        std::vector<ColumnConfig> missing;
        for (const auto& c : added) {
            if (!present.count(NameMapper::fold(NameMapper::to_physical_column(c.key)))) {
                missing.push_back(c);
            }
        }

        for (const auto& stmt : QueryTranslator::alter_table(table_key, missing)) {
            Status st = db_.execute(stmt.sql).status();
            if (!st.ok()) return st;
        }
        return Status::success();
    }

    Outcome<std::vector<TableConfig>> read_configs(const Statement& stmt) {
        using R = Outcome<std::vector<TableConfig>>;
        auto result = db_.query(stmt.sql, stmt.params);
        if (!result.ok()) return R::fail(result.status());

        std::vector<TableConfig> configs;
        for (const auto& row : result) {
            auto cfg = config_from_row(row);
            if (!cfg.ok()) return R::fail(cfg.status);
            configs.push_back(std::move(cfg.value));
        }
        return R::of(std::move(configs));
    }

    Outcome<TableConfig> config_from_row(const Row& row) {
        auto columns = registry_config().storage_columns();
        json j = json::object();
        for (size_t i = 0; i < columns.size() && i < row.size(); ++i) {
            auto decoded = ColumnCodec::decode(row[i], columns[i].type);
            if (!decoded.ok()) return Outcome<TableConfig>::fail(decoded.status);
            if (decoded.value) j[columns[i].key] = std::move(*decoded.value);
        }
        return table_config_from_json(j);
    }

    Database& db_;
};

} // namespace tabsql

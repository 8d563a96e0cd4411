/**
 * tabsql/table_store.hpp - Typed JSON tables persisted in SQLite
 *
 * Part of tabsql - a schema-versioned JSON table store on SQLite.
 *
 * Example usage:
 *
 *   tabsql::TableStore store;
 *   if (auto st = store.init(); !st.ok()) {
 *       fprintf(stderr, "init: %s\n", st.error.c_str());
 *       return 1;
 *   }
 *
 *   tabsql::TableConfig users{"users", "components",
 *                             {{"id", tabsql::ColumnType::Number},
 *                              {"name", tabsql::ColumnType::String}}, ""};
 *   store.create_or_extend_table(users);
 *
 *   tabsql::Table t;
 *   t.type = "components";
 *   t.data.push_back({{"id", 1}, {"name", "Alice"}});
 *   store.write({{"users", t}});
 *
 *   auto alice = store.read_rows("users", {{"name", "Alice"}});
 *
 * One store owns one connection. Calls are synchronous and run their
 * statements strictly one after another; the store is not thread-safe.
 */

#pragma once

#include "column_codec.hpp"
#include "config.hpp"
#include "database.hpp"
#include "integrity.hpp"
#include "name_mapper.hpp"
#include "query_translator.hpp"
#include "schema_registry.hpp"
#include "types.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tabsql {

// ============================================================================
// Ready Gate
// ============================================================================

/// One-shot readiness signal. Once opened it stays open.
class ReadyGate {
public:
    ReadyGate() : future_(promise_.get_future().share()) {}

    void open() {
        if (!is_open()) promise_.set_value();
    }

    bool is_open() const {
        return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    std::shared_future<void> future() const { return future_; }

private:
    std::promise<void> promise_;
    std::shared_future<void> future_;
};

// ============================================================================
// Table Store
// ============================================================================

class TableStore {
public:
    using log_func_t = std::function<void(const std::string& msg)>;
    using TableMap = std::map<std::string, Table>;

    TableStore() = default;
    explicit TableStore(const StoreConfig& config) : config_(config) {}

    // Non-copyable
    TableStore(const TableStore&) = delete;
    TableStore& operator=(const TableStore&) = delete;

    void set_config(const StoreConfig& config) { config_ = config; }
    void set_log_func(log_func_t func) { log_func_ = std::move(func); }
    const StoreConfig& config() const { return config_; }

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * Open the connection, bootstrap the registry and open the ready gate.
     * Call exactly once.
     */
    Status init() {
        if (ready_.is_open() || db_.is_open()) {
            return Status::fail(ErrorCode::AlreadyOpen, "Store is already initialized");
        }
        Status st = db_.open(config_.path);
        if (!st.ok()) return st;

        st = registry_.bootstrap();
        if (!st.ok()) {
            log("Registry bootstrap failed: " + st.error);
            (void)db_.close();
            return st;
        }

        ready_.open();
        log("Opened " + config_.path);
        return Status::success();
    }

    Status close() {
        Status st = db_.close();
        if (st.ok()) log("Closed " + config_.path);
        return st;
    }

    bool is_open() const { return db_.is_open(); }
    bool is_ready() const { return ready_.is_open(); }

    /// Becomes ready when init() completes.
    std::shared_future<void> ready() const { return ready_.future(); }

    Database& database() { return db_; }

    // ========================================================================
    // Schema
    // ========================================================================

    Status create_or_extend_table(const TableConfig& cfg) {
        Status st = require_ready();
        if (!st.ok()) return st;
        if (NameMapper::is_reserved_table(cfg.key)) {
            return Status::fail(ErrorCode::InvalidKey, "Table key " + cfg.key + " is reserved");
        }

        auto change = registry_.register_or_extend(cfg);
        if (!change.ok()) return change.status;

        switch (change.value) {
            case SchemaChange::Created:
                log("Created table " + cfg.key);
                break;
            case SchemaChange::Extended:
                log("Extended table " + cfg.key + " to " + std::to_string(cfg.columns.size()) +
                    " columns");
                break;
            case SchemaChange::Unchanged:
                break;
        }
        return Status::success();
    }

    Outcome<bool> table_exists(const std::string& table_key) {
        Status st = require_ready();
        if (!st.ok()) return Outcome<bool>::fail(st);
        if (!NameMapper::validate_key(table_key).ok()) return Outcome<bool>::of(false);

        auto stmt = QueryTranslator::table_exists(table_key);
        auto result = db_.query(stmt.sql, stmt.params);
        if (!result.ok()) return Outcome<bool>::fail(result.status());
        return Outcome<bool>::of(!result.empty());
    }

    Outcome<TableConfig> table_config(const std::string& table_key) {
        Status st = require_ready();
        if (!st.ok()) return Outcome<TableConfig>::fail(st);
        return registry_.active_config(table_key);
    }

    /**
     * Semantic kind of a table, as declared in its config.
     */
    Outcome<std::string> content_type(const std::string& table_key) {
        auto cfg = table_config(table_key);
        if (!cfg.ok()) return Outcome<std::string>::fail(cfg.status);
        return Outcome<std::string>::of(cfg.value.type);
    }

    Outcome<std::vector<TableConfig>> config_history(const std::string& table_key) {
        Status st = require_ready();
        if (!st.ok()) return Outcome<std::vector<TableConfig>>::fail(st);
        return registry_.config_history(table_key);
    }

    /**
     * Every persisted config version, including superseded ones.
     */
    Outcome<std::vector<TableConfig>> raw_table_configs() {
        Status st = require_ready();
        if (!st.ok()) return Outcome<std::vector<TableConfig>>::fail(st);
        return registry_.all_configs();
    }

    // ========================================================================
    // Data
    // ========================================================================

    /**
     * Insert the rows of every table. Table types, columns and value types
     * are checked before anything is written. Row hashes are stamped where
     * missing. A row that already exists is skipped silently; other row
     * failures are collected and reported together as AggregateWriteError
     * after every row was attempted. Rows written before a failure stay.
     */
    Status write(const TableMap& tables) {
        Status st = require_ready();
        if (!st.ok()) return st;

        struct Pending {
            std::string key;
            TableConfig cfg;
            std::vector<json> rows;
        };
        std::vector<Pending> pending;

        for (const auto& [key, table] : tables) {
            if (NameMapper::is_reserved_table(key)) {
                return Status::fail(ErrorCode::InvalidKey,
                                    "Table " + key + " cannot be written directly");
            }
            auto cfg = registry_.active_config(key);
            if (!cfg.ok()) return cfg.status;
            if (table.type != cfg.value.type) {
                return Status::fail(ErrorCode::SchemaIncompatible,
                                    "Table " + key + " is of type " + cfg.value.type +
                                    ", not " + table.type);
            }

            Pending p{key, std::move(cfg.value), {}};
            for (const auto& row : table.data) {
                auto prepared = prepare_row(p.cfg, row);
                if (!prepared.ok()) return prepared.status;
                p.rows.push_back(std::move(prepared.value));
            }
            pending.push_back(std::move(p));
        }

        std::vector<std::string> errors;
        for (const auto& p : pending) {
            auto columns = p.cfg.storage_columns();
            auto keys = p.cfg.storage_column_keys();
            for (const auto& row : p.rows) {
                std::vector<Value> values;
                values.reserve(columns.size());
                std::string encode_error;
                for (const auto& c : columns) {
                    auto it = row.find(c.key);
                    auto encoded = ColumnCodec::encode(it != row.end() ? *it : json(), c.type);
                    if (!encoded.ok()) {
                        encode_error = encoded.error();
                        break;
                    }
                    values.push_back(std::move(encoded.value));
                }
                if (!encode_error.empty()) {
                    errors.push_back("Error inserting into table " + p.key + ": " + encode_error);
                    continue;
                }

                auto stmt = QueryTranslator::insert_row(p.key, keys, std::move(values));
                auto result = db_.execute(stmt.sql, stmt.params);
                if (!result.ok() && result.sqlite_code != SQLITE_CONSTRAINT_PRIMARYKEY) {
                    errors.push_back("Error inserting into table " + p.key + ": " + result.error);
                }
            }
        }

        if (!errors.empty()) {
            std::string joined;
            for (size_t i = 0; i < errors.size(); ++i) {
                if (i > 0) joined += ", ";
                joined += errors[i];
            }
            Status failed = Status::fail(ErrorCode::AggregateWriteError,
                                         "Errors occurred: " + joined);
            failed.details = std::move(errors);
            log(failed.error);
            return failed;
        }
        return Status::success();
    }

    /**
     * write() for tables given as JSON: {"<key>": {"type", "data", ...}, ...}.
     * A top-level _hash is ignored.
     */
    Status write_json(const json& tables) {
        if (!tables.is_object()) {
            return Status::fail(ErrorCode::UnsupportedValue, "Tables must be a JSON object");
        }
        TableMap parsed;
        for (const auto& [key, value] : tables.items()) {
            if (key == kHashField) continue;
            auto table = table_from_json(value);
            if (!table.ok()) return table.status;
            parsed.emplace(key, std::move(table.value));
        }
        return write(parsed);
    }

    /**
     * Rows whose columns equal every value of the filter object. A null
     * filter value matches NULL. No match is an empty table, not an error.
     */
    Outcome<Table> read_rows(const std::string& table_key, const json& where) {
        if (!where.is_null() && !where.is_object()) {
            return Outcome<Table>::fail(ErrorCode::UnsupportedValue, "Filter must be an object");
        }
        std::vector<Predicate> predicates;
        if (where.is_object()) {
            for (const auto& [column, value] : where.items()) {
                predicates.emplace_back(column, value);
            }
        }
        return select_rows(table_key, predicates);
    }

    Outcome<Table> dump_table(const std::string& table_key) {
        auto cfg = require_table(table_key);
        if (!cfg.ok()) return Outcome<Table>::fail(cfg.status);
        return load(cfg.value,
                    QueryTranslator::select_all(table_key, cfg.value.storage_column_keys()));
    }

    /**
     * Every registered table, the registry included. The dump's own hash is
     * stamped once all tables are collected.
     */
    Outcome<Dump> dump() {
        Status st = require_ready();
        if (!st.ok()) return Outcome<Dump>::fail(st);

        auto keys = registry_.registered_keys();
        if (!keys.ok()) return Outcome<Dump>::fail(keys.status);

        Dump out;
        for (const auto& key : keys.value) {
            auto table = dump_table(key);
            if (!table.ok()) return Outcome<Dump>::fail(table.status);
            out.tables[key] = std::move(table.value);
        }

        json j = out;
        st = IntegrityEngine::stamp_missing(j);
        if (!st.ok()) return Outcome<Dump>::fail(st);
        out.hash = j[kHashField].get<std::string>();
        return Outcome<Dump>::of(std::move(out));
    }

    Outcome<int64_t> row_count(const std::string& table_key) {
        auto cfg = require_table(table_key);
        if (!cfg.ok()) return Outcome<int64_t>::fail(cfg.status);

        auto result = db_.query(QueryTranslator::count_rows(table_key).sql);
        if (!result.ok()) return Outcome<int64_t>::fail(result.status());
        int64_t count = 0;
        if (!result.empty()) {
            if (auto* n = std::get_if<int64_t>(&result[0][0])) count = *n;
        }
        return Outcome<int64_t>::of(count);
    }

private:
    Status require_ready() const {
        if (!ready_.is_open()) {
            return Status::fail(ErrorCode::NotReady, "Store is not ready, call init() first");
        }
        if (!db_.is_open()) {
            return Status::fail(ErrorCode::NotOpen, "Store is closed");
        }
        return Status::success();
    }

    Outcome<Table> select_rows(const std::string& table_key,
                               const std::vector<Predicate>& where) {
        auto cfg = require_table(table_key);
        if (!cfg.ok()) return Outcome<Table>::fail(cfg.status);

        for (const auto& predicate : where) {
            if (predicate.first != kHashField && !cfg.value.has_column(predicate.first)) {
                return Outcome<Table>::fail(ErrorCode::ColumnNotFound,
                                            "Column " + predicate.first + " not found in table " +
                                            table_key);
            }
        }

        auto stmt = QueryTranslator::select_where(table_key, cfg.value.storage_column_keys(),
                                                  where);
        if (!stmt.ok()) return Outcome<Table>::fail(stmt.status);
        return load(cfg.value, stmt.value);
    }

    Outcome<TableConfig> require_table(const std::string& table_key) {
        Status st = require_ready();
        if (!st.ok()) return Outcome<TableConfig>::fail(st);
        st = NameMapper::validate_key(table_key);
        if (!st.ok()) {
            return Outcome<TableConfig>::fail(ErrorCode::TableNotFound,
                                              "Table " + table_key + " not found");
        }
        return registry_.active_config(table_key);
    }

    /**
     * Check a row against its table config and return it in sparse form
     * with its hash stamped.
     */
    Outcome<json> prepare_row(const TableConfig& cfg, const json& row) {
        using R = Outcome<json>;
        if (!row.is_object()) {
            return R::fail(ErrorCode::UnsupportedValue,
                           "Rows of table " + cfg.key + " must be objects");
        }

        json sparse = json::object();
        for (const auto& [column, value] : row.items()) {
            if (value.is_null()) continue;
            if (column == kHashField && !cfg.has_column(kHashField)) {
                if (!value.is_string()) {
                    return R::fail(ErrorCode::UnsupportedValue, "Row hash must be a string");
                }
            } else {
                const ColumnConfig* c = cfg.find_column(column);
                if (!c) {
                    return R::fail(ErrorCode::ColumnNotFound,
                                   "Column " + column + " not found in table " + cfg.key);
                }
                Status st = ColumnCodec::check(value, c->type);
                if (!st.ok()) {
                    st.error = "Table " + cfg.key + ", column " + column + ": " + st.error;
                    return R::fail(st);
                }
            }
            sparse[column] = value;
        }

        Status st = config_.strict_hashes && sparse.contains(kHashField)
                        ? IntegrityEngine::verify(sparse)
                        : IntegrityEngine::stamp_missing(sparse);
        if (!st.ok()) return R::fail(st);
        return R::of(std::move(sparse));
    }

    Outcome<Table> load(const TableConfig& cfg, const Statement& stmt) {
        using R = Outcome<Table>;
        auto result = db_.query(stmt.sql, stmt.params);
        if (!result.ok()) return R::fail(result.status());

        auto columns = cfg.storage_columns();
        Table table;
        table.type = cfg.type;
        table.table_config_hash = cfg.hash;

        for (const auto& row : result) {
            json decoded = json::object();
            for (size_t i = 0; i < columns.size() && i < row.size(); ++i) {
                auto value = ColumnCodec::decode(row[i], columns[i].type);
                if (!value.ok()) return R::fail(value.status);
                if (value.value) decoded[columns[i].key] = std::move(*value.value);
            }
            Status st = IntegrityEngine::stamp_missing(decoded);
            if (!st.ok()) return R::fail(st);
            table.data.push_back(std::move(decoded));
        }

        std::sort(table.data.begin(), table.data.end(), [](const json& a, const json& b) {
            return a[kHashField].get<std::string>() < b[kHashField].get<std::string>();
        });

        json j = table;
        Status st = IntegrityEngine::stamp_missing(j);
        if (!st.ok()) return R::fail(st);
        table.hash = j[kHashField].get<std::string>();
        return R::of(std::move(table));
    }

    void log(const std::string& msg) {
        if (log_func_) {
            log_func_(msg);
        } else if (config_.verbose) {
            std::cerr << "[tabsql] " << msg << std::endl;
        }
    }

    StoreConfig config_;
    log_func_t log_func_;
    Database db_;
    SchemaRegistry registry_{db_};
    ReadyGate ready_;
};

} // namespace tabsql

/**
 * tabsql/name_mapper.hpp - Logical key <-> physical SQLite identifier mapping
 *
 * Part of tabsql - a schema-versioned JSON table store on SQLite.
 *
 * Physical names carry a suffix so no logical key can hit an SQL keyword
 * ("order" becomes "order_tbl" / "order_col") and so the registry's own
 * table never shares a name with a user table. Only keys that pass
 * validate_key() are ever spliced into SQL text.
 *
 * SQLite compares identifiers without regard to ASCII case, so two keys that
 * differ only in case name the same physical object. Callers use fold() to
 * detect such pairs before creating anything.
 */

#pragma once

#include "errors.hpp"

#include <string>

namespace tabsql {

class NameMapper {
public:
    static constexpr const char* kTableSuffix = "_tbl";
    static constexpr const char* kColumnSuffix = "_col";
    static constexpr const char* kRegistryTable = "tableCfgs";
    static constexpr const char* kSqlitePrefix = "sqlite_";
    static constexpr size_t kMaxKeyLength = 64;

    /**
     * Logical keys are identifiers: [A-Za-z_][A-Za-z0-9_]*, at most 64 chars,
     * not starting with "sqlite_" in any case.
     */
    static Status validate_key(const std::string& key) {
        if (key.empty() || key.size() > kMaxKeyLength) {
            return Status::fail(ErrorCode::InvalidKey, "Invalid key '" + key + "': bad length");
        }
        for (size_t i = 0; i < key.size(); ++i) {
            char c = key[i];
            bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
            bool digit = c >= '0' && c <= '9';
            if (!alpha && !(digit && i > 0)) {
                return Status::fail(ErrorCode::InvalidKey,
                                    "Invalid key '" + key + "': unexpected character");
            }
        }
        if (fold(key).rfind(kSqlitePrefix, 0) == 0) {
            return Status::fail(ErrorCode::InvalidKey,
                                "Invalid key '" + key + "': sqlite_ prefix is reserved");
        }
        return Status::success();
    }

    /// ASCII lower case, the equivalence SQLite applies to identifiers.
    static std::string fold(const std::string& key) {
        std::string out = key;
        for (auto& c : out) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        return out;
    }

    static bool same_identifier(const std::string& a, const std::string& b) {
        return fold(a) == fold(b);
    }

    static bool is_reserved_table(const std::string& key) {
        return same_identifier(key, kRegistryTable);
    }

    static std::string to_physical_table(const std::string& key) {
        return key + kTableSuffix;
    }

    static std::string to_physical_column(const std::string& key) {
        return key + kColumnSuffix;
    }

    static Outcome<std::string> to_logical_table(const std::string& physical) {
        return strip(physical, kTableSuffix);
    }

    static Outcome<std::string> to_logical_column(const std::string& physical) {
        return strip(physical, kColumnSuffix);
    }

private:
    static Outcome<std::string> strip(const std::string& physical, const std::string& suffix) {
        if (physical.size() <= suffix.size() ||
            physical.compare(physical.size() - suffix.size(), suffix.size(), suffix) != 0) {
            return Outcome<std::string>::fail(
                ErrorCode::InvalidKey, "Identifier '" + physical + "' lacks suffix " + suffix);
        }
        return Outcome<std::string>::of(physical.substr(0, physical.size() - suffix.size()));
    }
};

} // namespace tabsql

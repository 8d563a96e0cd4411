/**
 * tabsql/column_codec.hpp - Typed JSON value <-> SQLite storage value
 *
 * Part of tabsql - a schema-versioned JSON table store on SQLite.
 *
 *   boolean          <-> INTEGER 0/1
 *   json, jsonArray  <-> TEXT (serialized JSON)
 *   string, number   <-> passthrough
 *
 * JSON null encodes to NULL. NULL decodes to "absent": decode() returns an
 * empty optional and the caller leaves the key out of the row.
 */

#pragma once

#include "database.hpp"
#include "types.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace tabsql {

class ColumnCodec {
public:
    using Decoded = std::optional<json>;

    /**
     * Check that value may be stored in a column of the given type.
     */
    static Status check(const json& value, ColumnType type) {
        if (value.is_null()) return Status::success();
        bool match = false;
        switch (type) {
            case ColumnType::String:    match = value.is_string(); break;
            case ColumnType::Number:    match = value.is_number(); break;
            case ColumnType::Boolean:   match = value.is_boolean(); break;
            case ColumnType::Json:      match = value.is_object(); break;
            case ColumnType::JsonArray: match = value.is_array(); break;
        }
        if (!match) {
            return Status::fail(ErrorCode::UnsupportedValue,
                                std::string("Value of kind ") + value.type_name() +
                                " does not fit column type " + column_type_name(type));
        }
        if (value.is_number_float() && !std::isfinite(value.get<double>())) {
            return Status::fail(ErrorCode::UnsupportedValue, "Non-finite numbers are not storable");
        }
        return Status::success();
    }

    static Outcome<Value> encode(const json& value, ColumnType type) {
        using R = Outcome<Value>;
        Status st = check(value, type);
        if (!st.ok()) return R::fail(st);
        if (value.is_null()) return R::of(Value{});

        switch (type) {
            case ColumnType::String:
                return R::of(Value{value.get<std::string>()});
            case ColumnType::Number:
                return R::of(encode_number(value));
            case ColumnType::Boolean:
                return R::of(Value{static_cast<int64_t>(value.get<bool>() ? 1 : 0)});
            case ColumnType::Json:
            case ColumnType::JsonArray:
                try {
                    return R::of(Value{value.dump()});
                } catch (const json::type_error& e) {
                    return R::fail(ErrorCode::UnsupportedValue,
                                   std::string("Cannot serialize value: ") + e.what());
                }
        }
        return R::fail(ErrorCode::UnsupportedColumnType, "Unsupported column type");
    }

    static Outcome<Decoded> decode(const Value& stored, ColumnType type) {
        using R = Outcome<Decoded>;
        if (is_null(stored)) return R::of(std::nullopt);

        const auto* i = std::get_if<int64_t>(&stored);
        const auto* d = std::get_if<double>(&stored);
        const auto* s = std::get_if<std::string>(&stored);

        switch (type) {
            case ColumnType::String:
                if (s) return R::of(json(*s));
                break;
            case ColumnType::Number:
                if (i) return R::of(json(*i));
                if (d) return R::of(json(*d));
                break;
            case ColumnType::Boolean:
                if (i) return R::of(json(*i != 0));
                if (d) return R::of(json(*d != 0.0));
                break;
            case ColumnType::Json:
            case ColumnType::JsonArray:
                if (s) {
                    json parsed = json::parse(*s, nullptr, false);
                    if (parsed.is_discarded()) {
                        return R::fail(ErrorCode::UnsupportedValue,
                                       "Stored text is not valid JSON: " + *s);
                    }
                    return R::of(std::move(parsed));
                }
                break;
        }
        return R::fail(ErrorCode::UnsupportedValue,
                       "Stored value " + to_string(stored) + " does not decode as " +
                       column_type_name(type));
    }

private:
    static Value encode_number(const json& value) {
        if (value.is_number_unsigned()) {
            auto u = value.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Value{static_cast<double>(u)};
            }
            return Value{static_cast<int64_t>(u)};
        }
        if (value.is_number_integer()) {
            return Value{value.get<int64_t>()};
        }
        return Value{value.get<double>()};
    }
};

} // namespace tabsql

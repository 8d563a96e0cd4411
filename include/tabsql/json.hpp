#pragma once
/// @file json.hpp
/// @brief JSON library alias for tabsql
///
/// Provides a namespace alias for the JSON library used by tabsql.
/// Currently wraps nlohmann/json, whose default object type keeps keys
/// sorted, so dump() output is independent of insertion order.

#include <nlohmann/json.hpp>

namespace tabsql {

/// JSON type alias
using json = nlohmann::json;

/// Ordered JSON (preserves insertion order)
using ordered_json = nlohmann::ordered_json;

/// Reserved field carrying a content hash. Never part of its own hash.
inline constexpr const char* kHashField = "_hash";

} // namespace tabsql

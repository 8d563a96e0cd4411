/**
 * tabsql/config.hpp - Store configuration
 *
 * Part of tabsql - a schema-versioned JSON table store on SQLite.
 */

#pragma once

#include <string>

namespace tabsql {

struct StoreConfig {
    std::string path = ":memory:";
    bool strict_hashes = false;  // Reject rows whose "_hash" does not match their content
    bool verbose = false;        // Log to stderr when no log function is set
};

} // namespace tabsql

/**
 * tabsql/tabsql.hpp - Master include for tabsql
 *
 * tabsql - A schema-versioned JSON table store on SQLite
 *
 * Include this single header to get all tabsql functionality:
 *   - TableStore - create/extend, write, read, dump typed JSON tables
 *   - SchemaRegistry - append-only log of table configs
 *   - ColumnCodec, NameMapper, QueryTranslator - storage mapping
 *   - IntegrityEngine - canonical content hashes
 *   - Database - RAII SQLite wrapper with parameterized queries
 *
 * Example:
 *
 *   #include <tabsql/tabsql.hpp>
 *
 *   tabsql::TableStore store;
 *   store.init();
 *   store.create_or_extend_table({"users", "components",
 *                                 {{"id", tabsql::ColumnType::Number}}, ""});
 *   auto dump = store.dump();
 */

#pragma once

#include "json.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "config.hpp"
#include "database.hpp"
#include "name_mapper.hpp"
#include "column_codec.hpp"
#include "query_translator.hpp"
#include "integrity.hpp"
#include "schema_registry.hpp"
#include "table_store.hpp"

/**
 * users_table.cpp - Register, extend and dump a typed table
 *
 * Demonstrates the tabsql::TableStore API: additive schema evolution,
 * idempotent writes and filtered reads.
 */

#include <tabsql/tabsql.hpp>
#include <cstdio>

using tabsql::ColumnType;

static bool check(const tabsql::Status& st, const char* what) {
    if (!st.ok()) {
        fprintf(stderr, "%s failed (%s): %s\n", what, tabsql::error_code_name(st.code),
                st.error.c_str());
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    tabsql::StoreConfig config;
    if (argc > 1) config.path = argv[1];
    config.verbose = true;

    tabsql::TableStore store(config);
    if (!check(store.init(), "init")) return 1;

    // Version 1: id and name
    tabsql::TableConfig users{"users", "components",
                              {{"id", ColumnType::Number}, {"name", ColumnType::String}}, ""};
    if (!check(store.create_or_extend_table(users), "create")) return 1;

    tabsql::Table rows;
    rows.type = "components";
    rows.data.push_back({{"id", 1}, {"name", "Alice"}});
    rows.data.push_back({{"id", 2}, {"name", "Bob"}});
    if (!check(store.write({{"users", rows}}), "write")) return 1;

    // Writing the same rows again changes nothing
    if (!check(store.write({{"users", rows}}), "rewrite")) return 1;
    printf("Row count: %lld\n", static_cast<long long>(store.row_count("users").value));

    // Version 2: append an email column
    users.columns.push_back({"email", ColumnType::String});
    if (!check(store.create_or_extend_table(users), "extend")) return 1;

    // Tables can also arrive as JSON text
    auto carol = tabsql::json::parse(R"({
        "users": {
            "type": "components",
            "data": [{"id": 3, "name": "Carol", "email": "carol@example.com"}]
        }
    })");
    if (!check(store.write_json(carol), "write")) return 1;

    auto alice = store.read_rows("users", {{"name", "Alice"}});
    if (!check(alice.status, "read")) return 1;
    printf("\nAlice:\n%s\n", tabsql::json(alice.value).dump(2).c_str());

    auto dump = store.dump();
    if (!check(dump.status, "dump")) return 1;
    printf("\nDump:\n%s\n", tabsql::json(dump.value).dump(2).c_str());

    auto history = store.config_history("users");
    if (check(history.status, "history")) {
        printf("\nusers has %zu config versions\n", history.value.size());
    }

    return check(store.close(), "close") ? 0 : 1;
}

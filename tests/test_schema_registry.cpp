/**
 * test_schema_registry.cpp - Tests for additive schema evolution
 */

#include <gtest/gtest.h>
#include <tabsql/schema_registry.hpp>
#include <string>
#include <vector>

using tabsql::ColumnType;
using tabsql::ErrorCode;
using tabsql::SchemaChange;
using tabsql::SchemaRegistry;
using tabsql::TableConfig;

class SchemaRegistryTest : public ::testing::Test {
protected:
    tabsql::Database db_;
    SchemaRegistry registry_{db_};

    void SetUp() override {
        ASSERT_TRUE(db_.open(":memory:").ok());
        auto st = registry_.bootstrap();
        ASSERT_TRUE(st.ok()) << st.error;
    }

    static TableConfig users() {
        return TableConfig{"users", "components",
                           {{"id", ColumnType::Number}, {"name", ColumnType::String}}, ""};
    }

    std::vector<std::string> physical_columns(const std::string& table) {
        std::vector<std::string> names;
        auto result = db_.query("PRAGMA table_info(" + table + ")");
        for (const auto& row : result) names.push_back(std::get<std::string>(row[1]));
        return names;
    }
};

TEST_F(SchemaRegistryTest, BootstrapRegistersItself) {
    auto cfg = registry_.active_config("tableCfgs");
    ASSERT_TRUE(cfg.ok()) << cfg.error();
    EXPECT_EQ(cfg.value.columns.size(), 4u);
    EXPECT_EQ(cfg.value.hash, SchemaRegistry::registry_config().hash);
    EXPECT_FALSE(cfg.value.hash.empty());

    TableConfig unstamped = SchemaRegistry::registry_config();
    unstamped.hash.clear();
    EXPECT_EQ(cfg.value.hash, tabsql::IntegrityEngine::hash_of(tabsql::json(unstamped)).value);
}

TEST_F(SchemaRegistryTest, BootstrapIsRepeatable) {
    ASSERT_TRUE(registry_.bootstrap().ok());
    auto history = registry_.config_history("tableCfgs");
    ASSERT_TRUE(history.ok());
    EXPECT_EQ(history.value.size(), 1u);
}

TEST_F(SchemaRegistryTest, UnregisteredTableNotFound) {
    EXPECT_EQ(registry_.active_config("users").code(), ErrorCode::TableNotFound);
    EXPECT_EQ(registry_.config_history("users").code(), ErrorCode::TableNotFound);
    auto registered = registry_.is_registered("users");
    ASSERT_TRUE(registered.ok());
    EXPECT_FALSE(registered.value);
}

TEST_F(SchemaRegistryTest, RegisterCreatesTable) {
    auto change = registry_.register_or_extend(users());
    ASSERT_TRUE(change.ok()) << change.error();
    EXPECT_EQ(change.value, SchemaChange::Created);

    EXPECT_EQ(physical_columns("users_tbl"),
              (std::vector<std::string>{"_hash_col", "id_col", "name_col"}));

    auto active = registry_.active_config("users");
    ASSERT_TRUE(active.ok());
    EXPECT_EQ(active.value.columns, users().columns);
    EXPECT_EQ(active.value.type, "components");
    EXPECT_FALSE(active.value.hash.empty());
}

TEST_F(SchemaRegistryTest, SameConfigIsNoOp) {
    ASSERT_TRUE(registry_.register_or_extend(users()).ok());
    auto again = registry_.register_or_extend(users());
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value, SchemaChange::Unchanged);
    EXPECT_EQ(registry_.config_history("users").value.size(), 1u);
}

TEST_F(SchemaRegistryTest, AppendedColumnsExtendTable) {
    ASSERT_TRUE(registry_.register_or_extend(users()).ok());
    auto v1 = registry_.active_config("users").value;

    TableConfig next = users();
    next.columns.push_back({"email", ColumnType::String});
    next.columns.push_back({"tags", ColumnType::JsonArray});
    auto change = registry_.register_or_extend(next);
    ASSERT_TRUE(change.ok()) << change.error();
    EXPECT_EQ(change.value, SchemaChange::Extended);

    EXPECT_EQ(physical_columns("users_tbl"),
              (std::vector<std::string>{"_hash_col", "id_col", "name_col", "email_col", "tags_col"}));

    auto history = registry_.config_history("users");
    ASSERT_TRUE(history.ok());
    ASSERT_EQ(history.value.size(), 2u);
    EXPECT_EQ(history.value[0].hash, v1.hash);
    EXPECT_EQ(history.value[1].columns.size(), 4u);
    EXPECT_EQ(registry_.active_config("users").value.columns.size(), 4u);
}

TEST_F(SchemaRegistryTest, RemovedColumnIsIncompatible) {
    ASSERT_TRUE(registry_.register_or_extend(users()).ok());
    TableConfig shrunk = users();
    shrunk.columns.pop_back();
    EXPECT_EQ(registry_.register_or_extend(shrunk).code(), ErrorCode::SchemaIncompatible);
}

TEST_F(SchemaRegistryTest, ReorderedColumnsAreIncompatible) {
    ASSERT_TRUE(registry_.register_or_extend(users()).ok());
    TableConfig swapped = users();
    std::swap(swapped.columns[0], swapped.columns[1]);
    EXPECT_EQ(registry_.register_or_extend(swapped).code(), ErrorCode::SchemaIncompatible);
}

TEST_F(SchemaRegistryTest, RetypedColumnIsIncompatible) {
    ASSERT_TRUE(registry_.register_or_extend(users()).ok());
    TableConfig retyped = users();
    retyped.columns[1].type = ColumnType::Json;
    EXPECT_EQ(registry_.register_or_extend(retyped).code(), ErrorCode::SchemaIncompatible);

    // Nothing was persisted
    EXPECT_EQ(registry_.config_history("users").value.size(), 1u);
}

TEST_F(SchemaRegistryTest, ChangedTableTypeIsIncompatible) {
    ASSERT_TRUE(registry_.register_or_extend(users()).ok());
    TableConfig other = users();
    other.type = "layers";
    EXPECT_EQ(registry_.register_or_extend(other).code(), ErrorCode::SchemaIncompatible);
}

TEST_F(SchemaRegistryTest, InvalidKeysRejected) {
    TableConfig bad = users();
    bad.key = "users; DROP TABLE x";
    EXPECT_EQ(registry_.register_or_extend(bad).code(), ErrorCode::InvalidKey);

    TableConfig dup = users();
    dup.columns.push_back({"id", ColumnType::Number});
    EXPECT_EQ(registry_.register_or_extend(dup).code(), ErrorCode::InvalidKey);
}

TEST_F(SchemaRegistryTest, InterruptedMigrationConverges) {
    ASSERT_TRUE(registry_.register_or_extend(users()).ok());

    // Column already present physically, registry not yet updated
    ASSERT_TRUE(db_.execute("ALTER TABLE users_tbl ADD COLUMN email_col TEXT").ok());

    TableConfig next = users();
    next.columns.push_back({"email", ColumnType::String});
    auto change = registry_.register_or_extend(next);
    ASSERT_TRUE(change.ok()) << change.error();
    EXPECT_EQ(change.value, SchemaChange::Extended);
    EXPECT_EQ(registry_.active_config("users").value.columns.size(), 3u);
}

TEST_F(SchemaRegistryTest, CorruptColumnTypeIsUnsupportedColumnType) {
    ASSERT_TRUE(db_.execute("INSERT INTO tableCfgs_tbl (_hash_col, key_col, type_col, columns_col) "
                            "VALUES ('x', 'broken', 'components', '[{\"key\":\"a\",\"type\":\"date\"}]')")
                    .ok());
    EXPECT_EQ(registry_.active_config("broken").code(), ErrorCode::UnsupportedColumnType);
}

TEST_F(SchemaRegistryTest, AllConfigsAndKeysInRegistrationOrder) {
    ASSERT_TRUE(registry_.register_or_extend(users()).ok());
    TableConfig next = users();
    next.columns.push_back({"email", ColumnType::String});
    ASSERT_TRUE(registry_.register_or_extend(next).ok());
    ASSERT_TRUE(registry_.register_or_extend(
        TableConfig{"cars", "components", {{"brand", ColumnType::String}}, ""}).ok());

    auto all = registry_.all_configs();
    ASSERT_TRUE(all.ok());
    EXPECT_EQ(all.value.size(), 4u);

    auto keys = registry_.registered_keys();
    ASSERT_TRUE(keys.ok());
    EXPECT_EQ(keys.value, (std::vector<std::string>{"tableCfgs", "users", "cars"}));
}

TEST_F(SchemaRegistryTest, TableKeysDifferingOnlyInCaseCollide) {
    TableConfig upper{"Users", "components", {{"id", ColumnType::Number}}, ""};
    ASSERT_TRUE(registry_.register_or_extend(upper).ok());

    TableConfig lower{"users", "components", {{"name", ColumnType::String}}, ""};
    auto change = registry_.register_or_extend(lower);
    EXPECT_EQ(change.code(), ErrorCode::InvalidKey);
    EXPECT_FALSE(registry_.is_registered("users").value);
    EXPECT_EQ(physical_columns("Users_tbl"), (std::vector<std::string>{"_hash_col", "id_col"}));

    // The original key still extends normally
    upper.columns.push_back({"name", ColumnType::String});
    auto extended = registry_.register_or_extend(upper);
    ASSERT_TRUE(extended.ok()) << extended.error();
    EXPECT_EQ(extended.value, SchemaChange::Extended);
}

TEST_F(SchemaRegistryTest, ColumnKeysDifferingOnlyInCaseCollide) {
    TableConfig cfg{"users", "components",
                    {{"id", ColumnType::Number}, {"ID", ColumnType::String}}, ""};
    EXPECT_EQ(registry_.register_or_extend(cfg).code(), ErrorCode::InvalidKey);
    EXPECT_FALSE(registry_.is_registered("users").value);

    ASSERT_TRUE(registry_.register_or_extend(users()).ok());
    TableConfig extended = users();
    extended.columns.push_back({"Name", ColumnType::String});
    EXPECT_EQ(registry_.register_or_extend(extended).code(), ErrorCode::InvalidKey);
    EXPECT_EQ(registry_.config_history("users").value.size(), 1u);
}

TEST_F(SchemaRegistryTest, SqlitePrefixedKeysAreRejected) {
    TableConfig cfg{"sqlite_stat", "components", {{"id", ColumnType::Number}}, ""};
    EXPECT_EQ(registry_.register_or_extend(cfg).code(), ErrorCode::InvalidKey);

    TableConfig column{"users", "components", {{"sqlite_rowid", ColumnType::Number}}, ""};
    EXPECT_EQ(registry_.register_or_extend(column).code(), ErrorCode::InvalidKey);
}

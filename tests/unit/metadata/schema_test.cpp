#include <gtest/gtest.h>
#include <bspidx/metadata/database.h>
#include <bspidx/metadata/schema.h>

#include "../../common/test_helpers.h"

#include <filesystem>
#include <string>

using namespace bspidx;
using namespace bspidx::metadata;

namespace {

std::string queryText(Database& db, const std::string& sql) {
    auto stmt = db.prepare(sql);
    if (!stmt)
        return "<error>";
    auto s = std::move(stmt).value();
    auto row = s.step();
    if (!row || !row.value())
        return "<none>";
    return s.getString(0);
}

} // namespace

class SchemaTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tests::make_temp_dir("bspidx_schema_");
        dbPath_ = dir_ / "index.bspidx";
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path dir_;
    std::filesystem::path dbPath_;
};

TEST_F(SchemaTest, CreatesAllTables) {
    Database db;
    auto init = initializeIndexStore(db, dbPath_);
    ASSERT_TRUE(init) << init.error().message;

    for (const char* table : {"files", "symbols", "includes", "dt_nodes", "dt_properties",
                              "gpio_pins", "metadata", "symbols_fts"}) {
        auto exists = db.tableExists(table);
        ASSERT_TRUE(exists.has_value());
        EXPECT_TRUE(exists.value()) << table;
    }
    EXPECT_EQ(queryText(db, "PRAGMA user_version"), std::to_string(kSchemaVersion));
}

TEST_F(SchemaTest, AppliesWritePragmas) {
    Database db;
    ASSERT_TRUE(initializeIndexStore(db, dbPath_));

    EXPECT_EQ(queryText(db, "PRAGMA journal_mode"), "wal");
    EXPECT_EQ(queryText(db, "PRAGMA synchronous"), "1");
    EXPECT_EQ(queryText(db, "PRAGMA cache_size"), "-64000");
    EXPECT_EQ(queryText(db, "PRAGMA foreign_keys"), "1");
}

TEST_F(SchemaTest, CreatesSecondaryIndexes) {
    Database db;
    ASSERT_TRUE(initializeIndexStore(db, dbPath_));

    for (const char* index : {"idx_files_path", "idx_symbols_name", "idx_includes_to",
                              "idx_dt_nodes_label", "idx_dt_props_node", "idx_gpio_controller"}) {
        EXPECT_EQ(queryText(db, std::string("SELECT name FROM sqlite_master WHERE type='index' "
                                            "AND name='") +
                                    index + "'"),
                  index);
    }
}

TEST_F(SchemaTest, SymbolInsertsReachFullTextIndex) {
    Database db;
    ASSERT_TRUE(initializeIndexStore(db, dbPath_));
    ASSERT_TRUE(db.execute("INSERT INTO files (path, name, type) VALUES ('a.conf', 'a.conf', "
                           "'config')"));
    ASSERT_TRUE(db.execute("INSERT INTO symbols (name, value, type, file_id, line) "
                           "VALUES ('MACHINE', 'imx8mpevk', 'variable', 1, 1)"));

    EXPECT_EQ(queryText(db, "SELECT name FROM symbols_fts WHERE symbols_fts MATCH 'imx8mpevk'"),
              "MACHINE");

    ASSERT_TRUE(db.execute("DELETE FROM symbols"));
    EXPECT_EQ(queryText(db, "SELECT name FROM symbols_fts WHERE symbols_fts MATCH 'imx8mpevk'"),
              "<none>");
}

TEST_F(SchemaTest, ReinitializeReplacesPreviousSnapshot) {
    {
        Database db;
        ASSERT_TRUE(initializeIndexStore(db, dbPath_));
        ASSERT_TRUE(db.execute("INSERT INTO metadata (key, value) VALUES ('stale', 'yes')"));
    }

    Database db;
    ASSERT_TRUE(initializeIndexStore(db, dbPath_));
    EXPECT_EQ(queryText(db, "SELECT COUNT(*) FROM metadata"), "0");
}

TEST_F(SchemaTest, UnwritableLocationFails) {
    Database db;
    auto init = initializeIndexStore(db, dir_ / "missing-dir" / "index.bspidx");
    ASSERT_FALSE(init);
    EXPECT_FALSE(db.isOpen());
    EXPECT_NE(init.error().message.find("missing-dir"), std::string::npos);
}

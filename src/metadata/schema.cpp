#include <bspidx/metadata/schema.h>
#include <spdlog/spdlog.h>

#include <string>

namespace bspidx::metadata {

namespace {

// dt_nodes.parent_id carries no foreign key; parents are resolved per file while inserting.
constexpr const char* kSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS files (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        path TEXT NOT NULL UNIQUE,
        name TEXT NOT NULL,
        type TEXT NOT NULL,
        size INTEGER,
        mtime INTEGER
    );
    CREATE INDEX IF NOT EXISTS idx_files_path ON files(path);
    CREATE INDEX IF NOT EXISTS idx_files_type ON files(type);

    CREATE TABLE IF NOT EXISTS symbols (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        name TEXT NOT NULL,
        value TEXT,
        type TEXT NOT NULL,
        file_id INTEGER REFERENCES files(id) ON DELETE CASCADE,
        line INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_symbols_name ON symbols(name);
    CREATE INDEX IF NOT EXISTS idx_symbols_file ON symbols(file_id);

    CREATE TABLE IF NOT EXISTS includes (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        from_file_id INTEGER REFERENCES files(id) ON DELETE CASCADE,
        to_path TEXT NOT NULL,
        type TEXT NOT NULL,
        line INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_includes_from ON includes(from_file_id);
    CREATE INDEX IF NOT EXISTS idx_includes_to ON includes(to_path);

    CREATE TABLE IF NOT EXISTS dt_nodes (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        file_id INTEGER REFERENCES files(id) ON DELETE CASCADE,
        path TEXT NOT NULL,
        name TEXT NOT NULL,
        label TEXT,
        address TEXT,
        parent_id INTEGER,
        start_line INTEGER NOT NULL,
        end_line INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_dt_nodes_path ON dt_nodes(path);
    CREATE INDEX IF NOT EXISTS idx_dt_nodes_label ON dt_nodes(label);
    CREATE INDEX IF NOT EXISTS idx_dt_nodes_file ON dt_nodes(file_id);

    CREATE TABLE IF NOT EXISTS dt_properties (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        node_id INTEGER REFERENCES dt_nodes(id) ON DELETE CASCADE,
        name TEXT NOT NULL,
        value TEXT,
        line INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_dt_props_node ON dt_properties(node_id);
    CREATE INDEX IF NOT EXISTS idx_dt_props_name ON dt_properties(name);

    CREATE TABLE IF NOT EXISTS gpio_pins (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        file_id INTEGER REFERENCES files(id) ON DELETE CASCADE,
        controller TEXT NOT NULL,
        pin INTEGER NOT NULL,
        label TEXT,
        function TEXT,
        direction TEXT,
        line INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_gpio_controller ON gpio_pins(controller);
    CREATE INDEX IF NOT EXISTS idx_gpio_label ON gpio_pins(label);

    CREATE TABLE IF NOT EXISTS metadata (
        key TEXT PRIMARY KEY,
        value TEXT
    );

    CREATE VIRTUAL TABLE IF NOT EXISTS symbols_fts USING fts5(
        name, value, content='symbols', content_rowid='id'
    );

    CREATE TRIGGER IF NOT EXISTS symbols_ai AFTER INSERT ON symbols BEGIN
        INSERT INTO symbols_fts(rowid, name, value) VALUES (new.id, new.name, new.value);
    END;

    CREATE TRIGGER IF NOT EXISTS symbols_ad AFTER DELETE ON symbols BEGIN
        INSERT INTO symbols_fts(symbols_fts, rowid, name, value)
        VALUES ('delete', old.id, old.name, old.value);
    END;
)";

Result<void> removeSnapshot(const std::filesystem::path& path) {
    for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
        std::filesystem::path target = path;
        target += suffix;
        std::error_code ec;
        std::filesystem::remove(target, ec);
        if (ec) {
            return Error{ErrorCode::PermissionDenied,
                         "Cannot remove previous index " + target.string() + ": " + ec.message()};
        }
    }
    return {};
}

} // namespace

Result<void> createSchema(Database& db) {
    auto result = db.execute(kSchemaSql);
    if (!result)
        return result;
    return db.execute("PRAGMA user_version = " + std::to_string(kSchemaVersion));
}

Result<void> initializeIndexStore(Database& db, const std::filesystem::path& path) {
    if (auto removed = removeSnapshot(path); !removed)
        return removed;

    auto opened = db.open(path.string(), ConnectionMode::Create);
    if (!opened)
        return opened;

    auto fts5 = db.hasFTS5();
    if (!fts5 || !fts5.value()) {
        db.close();
        return Error{ErrorCode::NotSupported, "SQLite was built without FTS5"};
    }

    for (const char* pragma : {"PRAGMA journal_mode = WAL", "PRAGMA synchronous = NORMAL",
                               "PRAGMA cache_size = -64000", "PRAGMA foreign_keys = ON"}) {
        if (auto r = db.execute(pragma); !r) {
            db.close();
            return r;
        }
    }

    if (auto r = createSchema(db); !r) {
        db.close();
        return Error{ErrorCode::DatabaseError,
                     "Failed to create index schema at " + path.string() + ": " +
                         r.error().message};
    }

    spdlog::debug("Initialized index store at {} (SQLite {})", path.string(), Database::version());
    return {};
}

} // namespace bspidx::metadata

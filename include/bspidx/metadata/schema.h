#pragma once

#include <bspidx/core/types.h>
#include <bspidx/metadata/database.h>

#include <filesystem>

namespace bspidx::metadata {

inline constexpr int kSchemaVersion = 1;

/**
 * @brief Create tables, secondary indexes, the symbols_fts index and the
 * triggers that keep it in sync with symbols.
 */
Result<void> createSchema(Database& db);

/**
 * @brief Replace any snapshot at path with an empty, configured store.
 *
 * Removes the old file with its -wal/-shm companions, opens a new database,
 * applies the write pragmas and creates the schema. Requires FTS5.
 */
Result<void> initializeIndexStore(Database& db, const std::filesystem::path& path);

} // namespace bspidx::metadata

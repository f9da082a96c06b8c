#include <bspidx/metadata/index_store.h>
#include <spdlog/spdlog.h>

#include <unordered_map>

namespace bspidx::metadata {

using extraction::FileFacts;

struct IndexStore::BatchStatements {
    Statement file;
    Statement symbol;
    Statement include;
    Statement node;
    Statement property;
    Statement gpio;
};

namespace {

Result<Statement> prepareInto(Database& db, const char* sql) {
    return db.prepare(sql);
}

// Run a bound statement and leave it ready for the next row
Result<void> executeAndReset(Statement& stmt) {
    auto result = stmt.execute();
    auto reset = stmt.reset();
    if (!result)
        return result;
    return reset;
}

} // namespace

Result<WriteStats> IndexStore::writeBatch(const std::vector<FileFacts>& batch) {
    WriteStats stats;
    if (batch.empty())
        return stats;

    auto run = [&]() -> Result<void> {
        auto file = prepareInto(db_, "INSERT OR REPLACE INTO files (path, name, type, size, mtime) "
                                     "VALUES (?, ?, ?, ?, ?)");
        if (!file)
            return file.error();
        auto symbol = prepareInto(
            db_, "INSERT INTO symbols (name, value, type, file_id, line) VALUES (?, ?, ?, ?, ?)");
        if (!symbol)
            return symbol.error();
        auto include = prepareInto(
            db_, "INSERT INTO includes (from_file_id, to_path, type, line) VALUES (?, ?, ?, ?)");
        if (!include)
            return include.error();
        auto node = prepareInto(db_, "INSERT INTO dt_nodes (file_id, path, name, label, address, "
                                     "parent_id, start_line, end_line) "
                                     "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
        if (!node)
            return node.error();
        auto property = prepareInto(
            db_, "INSERT INTO dt_properties (node_id, name, value, line) VALUES (?, ?, ?, ?)");
        if (!property)
            return property.error();
        auto gpio = prepareInto(db_, "INSERT INTO gpio_pins (file_id, controller, pin, label, "
                                     "function, direction, line) VALUES (?, ?, ?, ?, ?, ?, ?)");
        if (!gpio)
            return gpio.error();

        BatchStatements statements{std::move(file).value(),    std::move(symbol).value(),
                                   std::move(include).value(), std::move(node).value(),
                                   std::move(property).value(), std::move(gpio).value()};

        for (const auto& result : batch) {
            auto written = writeFile(result, statements, stats);
            if (!written)
                return written;
        }
        return {};
    };

    auto committed = db_.transaction(run);
    if (!committed) {
        return Error{ErrorCode::TransactionFailed,
                     "Batch of " + std::to_string(batch.size()) + " files could not be committed to " +
                         db_.path() + ": " + committed.error().message};
    }
    return stats;
}

Result<void> IndexStore::writeFile(const FileFacts& result, BatchStatements& statements,
                                   WriteStats& stats) {
    const auto& record = result.file;
    const auto& facts = result.facts;

    if (auto r = statements.file.bindAll(record.path, record.name,
                                         extraction::toString(record.format), record.size,
                                         record.mtime);
        !r)
        return r;
    if (auto r = executeAndReset(statements.file); !r)
        return r;
    const RowId fileId = db_.lastInsertRowId();
    ++stats.files;

    for (const auto& sym : facts.symbols) {
        if (auto r = statements.symbol.bindAll(sym.name, sym.value, extraction::toString(sym.kind),
                                               fileId, sym.line);
            !r)
            return r;
        if (auto r = executeAndReset(statements.symbol); !r)
            return r;
        ++stats.symbols;
    }

    for (const auto& inc : facts.includes) {
        if (auto r = statements.include.bindAll(fileId, inc.target, extraction::toString(inc.kind),
                                                inc.line);
            !r)
            return r;
        if (auto r = executeAndReset(statements.include); !r)
            return r;
        ++stats.includes;
    }

    // Paths are only unique inside one file's tree; the map never outlives this file
    std::unordered_map<std::string, RowId> nodeIds;
    for (const auto& node : facts.nodes) {
        auto& stmt = statements.node;
        auto r = stmt.bindAll(fileId, node.path, node.name);
        if (r)
            r = stmt.bindOptional(4, node.label);
        if (r)
            r = stmt.bindOptional(5, node.address);
        if (r) {
            auto parent = node.parentPath.empty() ? nodeIds.end() : nodeIds.find(node.parentPath);
            r = parent == nodeIds.end() ? stmt.bind(6, nullptr) : stmt.bind(6, parent->second);
        }
        if (r)
            r = stmt.bind(7, node.startLine);
        if (r)
            r = stmt.bind(8, node.endLine);
        if (!r)
            return r;
        if (auto e = executeAndReset(stmt); !e)
            return e;
        nodeIds[node.path] = db_.lastInsertRowId();
        ++stats.dtNodes;
    }

    for (const auto& prop : facts.properties) {
        auto owner = nodeIds.find(prop.nodePath);
        if (owner == nodeIds.end()) {
            ++stats.droppedProperties;
            continue;
        }
        if (auto r = statements.property.bindAll(owner->second, prop.name, prop.value, prop.line);
            !r)
            return r;
        if (auto r = executeAndReset(statements.property); !r)
            return r;
        ++stats.dtProperties;
    }

    for (const auto& pin : facts.gpioPins) {
        auto& stmt = statements.gpio;
        auto r = stmt.bindAll(fileId, pin.controller, pin.pin, pin.label, pin.function);
        if (r)
            r = stmt.bindOptional(6, pin.direction);
        if (r)
            r = stmt.bind(7, pin.line);
        if (!r)
            return r;
        if (auto e = executeAndReset(stmt); !e)
            return e;
        ++stats.gpioPins;
    }

    return {};
}

Result<void> IndexStore::writeMetadata(
    const std::vector<std::pair<std::string, std::string>>& entries) {
    return db_.transaction([&]() -> Result<void> {
        auto stmtResult = db_.prepare("INSERT OR REPLACE INTO metadata (key, value) VALUES (?, ?)");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        for (const auto& [key, value] : entries) {
            if (auto r = stmt.bindAll(key, value); !r)
                return r;
            if (auto r = executeAndReset(stmt); !r)
                return r;
        }
        spdlog::debug("Wrote {} metadata entries", entries.size());
        return {};
    });
}

} // namespace bspidx::metadata

#include <bspidx/indexing/bsp_indexer.h>
#include <bspidx/indexing/crawler.h>
#include <bspidx/metadata/database.h>
#include <bspidx/metadata/index_store.h>
#include <bspidx/metadata/schema.h>
#include <bspidx/version.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <string>

namespace bspidx::indexing {

namespace fs = std::filesystem;

namespace {

std::string currentUser() {
    if (const char* user = std::getenv("USER"); user && *user)
        return user;
    if (const char* user = std::getenv("USERNAME"); user && *user)
        return user;
    return "unknown";
}

std::string localIsoTimestamp() {
    std::time_t now = std::time(nullptr);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}", fmt::localtime(now));
}

} // namespace

BspIndexer::BspIndexer(config::IndexerConfig config) : config_(std::move(config)) {
    if (config_.outputPath.empty()) {
        config_.outputPath = config::defaultOutputPath(config_.projectRoot);
    }
}

Result<RunSummary> BspIndexer::run() {
    if (auto valid = config::validate(config_); !valid) {
        return valid.error();
    }

    const auto started = std::chrono::steady_clock::now();
    RunSummary summary;
    summary.outputPath = config_.outputPath;
    summary.summaryPath = config::summaryPathFor(config_.outputPath);

    spdlog::info("Project: {}", config_.projectRoot.string());
    spdlog::info("Output: {}", config_.outputPath.string());

    std::error_code ec;
    if (auto parent = config_.outputPath.parent_path(); !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return Error{ErrorCode::PermissionDenied, "Cannot create output directory " +
                                                          parent.string() + ": " + ec.message()};
        }
    }

    // A summary left by an earlier run must not vouch for this one
    fs::remove(summary.summaryPath, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied, "Cannot remove stale summary " +
                                                      summary.summaryPath.string() + ": " +
                                                      ec.message()};
    }

    metadata::Database db;
    if (auto init = metadata::initializeIndexStore(db, config_.outputPath); !init) {
        return init.error();
    }

    Crawler crawler(config_.projectRoot, config_.excludePatterns);
    auto files = crawler.crawl();
    if (!files) {
        return files.error();
    }
    summary.directoriesPruned = crawler.stats().directoriesPruned;
    spdlog::info("Found {} files to index", files.value().size());

    metadata::IndexStore store(db);
    extraction::ExtractionLimits limits{config_.symbolValueLimit, config_.propertyValueLimit};
    auto stats = [&]() -> Result<IndexStats> {
        ParseCoordinator coordinator(store, config_.projectRoot, config_.workers,
                                     config_.batchSize, limits);
        return coordinator.run(files.value());
    }();
    if (!stats) {
        return stats.error();
    }
    summary.stats = stats.value();

    auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count();
    auto meta = store.writeMetadata({{"last_index_time", std::to_string(nowMs)},
                                     {"project_path", config_.projectRoot.string()},
                                     {"indexer_version", BSPIDX_VERSION_STRING}});
    if (!meta) {
        return meta.error();
    }
    db.close();

    summary.elapsedSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    const auto& written = summary.stats.written;
    spdlog::info("Completed in {:.1f}s", summary.elapsedSeconds);
    spdlog::info("  Files: {}", written.files);
    spdlog::info("  Symbols: {}", written.symbols);
    spdlog::info("  Includes: {}", written.includes);
    spdlog::info("  DT Nodes: {}", written.dtNodes);
    spdlog::info("  DT Properties: {}", written.dtProperties);
    spdlog::info("  GPIO Pins: {}", written.gpioPins);
    if (summary.stats.skipped > 0) {
        spdlog::warn("  Skipped: {}", summary.stats.skipped);
    }
    if (summary.stats.anomalies > 0 || written.droppedProperties > 0) {
        spdlog::debug("  Unbalanced closes: {}, dropped properties: {}", summary.stats.anomalies,
                      written.droppedProperties);
    }

    if (auto saved = writeSummary(summary); !saved) {
        return saved.error();
    }
    return summary;
}

Result<void> BspIndexer::writeSummary(const RunSummary& summary) const {
    const auto& written = summary.stats.written;

    nlohmann::json meta;
    meta["lastSaved"] = localIsoTimestamp();
    meta["savedBy"] = currentUser();
    meta["indexerVersion"] = BSPIDX_VERSION_STRING;
    meta["elapsed"] = std::round(summary.elapsedSeconds * 10.0) / 10.0;
    meta["stats"] = {{"files", written.files},
                     {"symbols", written.symbols},
                     {"includes", written.includes},
                     {"dt_nodes", written.dtNodes},
                     {"dt_properties", written.dtProperties},
                     {"gpio_pins", written.gpioPins},
                     {"skipped", summary.stats.skipped}};

    std::ofstream out(summary.summaryPath, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IOError,
                     "Cannot write summary file " + summary.summaryPath.string()};
    }
    out << meta.dump(2) << '\n';
    if (!out) {
        return Error{ErrorCode::IOError, "Write failed for " + summary.summaryPath.string()};
    }
    return {};
}

} // namespace bspidx::indexing

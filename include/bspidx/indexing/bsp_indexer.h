#pragma once

#include <bspidx/config/indexer_config.h>
#include <bspidx/core/types.h>
#include <bspidx/indexing/parse_coordinator.h>

#include <cstdint>
#include <filesystem>

namespace bspidx::indexing {

/**
 * @brief Outcome of a completed run
 */
struct RunSummary {
    std::filesystem::path outputPath;
    std::filesystem::path summaryPath;
    IndexStats stats;
    uint64_t directoriesPruned = 0;
    double elapsedSeconds = 0.0;
};

/**
 * @brief Drives one full indexing run: store setup, crawl, parse and write-back.
 *
 * Every run builds a fresh snapshot; an existing index at the output path is
 * replaced. The metadata rows and meta.json are only written once all batches
 * have committed, so a failed run never carries a completion record.
 */
class BspIndexer {
public:
    explicit BspIndexer(config::IndexerConfig config);

    Result<RunSummary> run();

    const config::IndexerConfig& config() const { return config_; }

private:
    Result<void> writeSummary(const RunSummary& summary) const;

    config::IndexerConfig config_;
};

} // namespace bspidx::indexing

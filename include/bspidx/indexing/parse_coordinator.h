#pragma once

#include <bspidx/core/types.h>
#include <bspidx/extraction/fact_extractor.h>
#include <bspidx/extraction/facts.h>
#include <bspidx/metadata/index_store.h>

#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

namespace bspidx::indexing {

/**
 * @brief Totals of one indexing run
 */
struct IndexStats {
    metadata::WriteStats written;
    uint64_t skipped = 0;   ///< Files that could not be read or extracted
    uint64_t anomalies = 0; ///< Unbalanced '}' seen in tree sources
};

/**
 * @brief Called after each committed batch with (processed, total)
 */
using ProgressCallback = std::function<void(size_t processed, size_t total)>;

/**
 * @brief Fans files out to a worker pool in fixed-size batches and commits each batch.
 *
 * Workers only read and extract; all writes happen on the calling thread, one
 * transaction per batch. A batch is fully extracted before it is written, and
 * the next batch is not dispatched until the write has committed.
 */
class ParseCoordinator {
public:
    ParseCoordinator(metadata::IndexStore& store, std::filesystem::path projectRoot,
                     size_t workers, size_t batchSize, extraction::ExtractionLimits limits = {});
    ~ParseCoordinator();

    ParseCoordinator(const ParseCoordinator&) = delete;
    ParseCoordinator& operator=(const ParseCoordinator&) = delete;

    void setProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

    /**
     * @brief Extract and store every file.
     *
     * Per-file failures are counted as skips. A failed batch write aborts the
     * run; batches committed before it stay in the store.
     */
    Result<IndexStats> run(const std::vector<extraction::FileDescriptor>& files);

    size_t workers() const { return workers_; }
    size_t batchSize() const { return batchSize_; }

private:
    struct Outcome;

    Outcome processFile(const extraction::FileDescriptor& file) const;

    metadata::IndexStore& store_;
    std::filesystem::path projectRoot_;
    size_t workers_;
    size_t batchSize_;
    extraction::ExtractionLimits limits_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    ProgressCallback progress_;
};

} // namespace bspidx::indexing

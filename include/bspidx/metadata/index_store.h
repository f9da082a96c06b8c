#pragma once

#include <bspidx/core/types.h>
#include <bspidx/extraction/facts.h>
#include <bspidx/metadata/database.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace bspidx::metadata {

/**
 * @brief Rows written for one batch (or, summed, for a run)
 */
struct WriteStats {
    uint64_t files = 0;
    uint64_t symbols = 0;
    uint64_t includes = 0;
    uint64_t dtNodes = 0;
    uint64_t dtProperties = 0;
    uint64_t gpioPins = 0;
    uint64_t droppedProperties = 0; ///< Properties whose node path had no row in the file

    WriteStats& operator+=(const WriteStats& other) {
        files += other.files;
        symbols += other.symbols;
        includes += other.includes;
        dtNodes += other.dtNodes;
        dtProperties += other.dtProperties;
        gpioPins += other.gpioPins;
        droppedProperties += other.droppedProperties;
        return *this;
    }
};

/**
 * @brief Writes extraction results into an initialized index store.
 *
 * Only the coordinating thread touches it; the database connection is not shared.
 */
class IndexStore {
public:
    explicit IndexStore(Database& db) : db_(db) {}

    /**
     * @brief Insert every file of the batch and its facts in one transaction.
     *
     * A failure rolls the whole batch back and is reported as TransactionFailed.
     */
    Result<WriteStats> writeBatch(const std::vector<extraction::FileFacts>& batch);

    /**
     * @brief Upsert key/value pairs into the metadata table.
     */
    Result<void> writeMetadata(const std::vector<std::pair<std::string, std::string>>& entries);

private:
    struct BatchStatements;

    Result<void> writeFile(const extraction::FileFacts& result, BatchStatements& statements,
                           WriteStats& stats);

    Database& db_;
};

} // namespace bspidx::metadata

#pragma once

#include <bspidx/core/types.h>
#include <bspidx/extraction/facts.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace bspidx::indexing {

struct CrawlStats {
    uint64_t directoriesPruned = 0;
    uint64_t entriesSkipped = 0; ///< Unreadable directories and entries that could not be stat'ed
};

/**
 * @brief Walks a project tree and classifies candidate files by extension.
 *
 * A directory whose path relative to the root (with a trailing '/') matches
 * an exclusion glob is pruned with everything below it. Unreadable
 * directories and non-regular files are skipped silently.
 */
class Crawler {
public:
    Crawler(std::filesystem::path root, std::vector<std::string> excludePatterns);

    /**
     * @brief Collect every indexable file; order follows the directory walk.
     * Fails only when the root itself cannot be opened.
     */
    Result<std::vector<extraction::FileDescriptor>> crawl();

    /**
     * @brief Whether a directory, given relative to the root, is excluded
     */
    bool isExcluded(std::string_view relativeDir) const;

    const CrawlStats& stats() const { return stats_; }

private:
    std::filesystem::path root_;
    std::vector<std::string> excludePatterns_;
    CrawlStats stats_;
};

} // namespace bspidx::indexing

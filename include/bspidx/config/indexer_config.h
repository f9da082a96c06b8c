#pragma once

#include <bspidx/core/types.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace bspidx::config {

/**
 * @brief Settings for one indexing run
 */
struct IndexerConfig {
    std::filesystem::path projectRoot;
    std::filesystem::path outputPath; ///< Empty means defaultOutputPath(projectRoot)

    size_t batchSize = 100;
    size_t workers = 8;

    /// Directory globs, matched against the directory path relative to the project root
    std::vector<std::string> excludePatterns = defaultExcludePatterns();

    size_t symbolValueLimit = 200;
    size_t propertyValueLimit = 500;

    std::string logLevel = "info";

    static std::vector<std::string> defaultExcludePatterns() {
        return {"*/tmp/work/*", "*/.git/*", "*/sstate-cache/*", "*/downloads/*"};
    }
};

/**
 * @brief Absolute path with '.', '..' and symlinks resolved as far as the path exists.
 */
std::filesystem::path resolvePath(const std::filesystem::path& path);

/// <project>/.bsp-index/index.bspidx
std::filesystem::path defaultOutputPath(const std::filesystem::path& projectRoot);

/// meta.json next to the index file
std::filesystem::path summaryPathFor(const std::filesystem::path& outputPath);

/**
 * @brief Overlay the [indexer] section of a TOML-style file onto config.
 * Missing keys leave the current values untouched.
 */
Result<void> applyConfigFile(IndexerConfig& config, const std::filesystem::path& path);

/**
 * @brief Overlay BSPIDX_LOG_LEVEL, BSPIDX_WORKERS and BSPIDX_BATCH_SIZE.
 */
Result<void> applyEnvironment(IndexerConfig& config);

/**
 * @brief Reject configurations the pipeline cannot run with.
 */
Result<void> validate(const IndexerConfig& config);

} // namespace bspidx::config

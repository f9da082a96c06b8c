#pragma once

#include <bspidx/core/types.h>
#include <bspidx/extraction/facts.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace bspidx::extraction {

/**
 * @brief Bounds applied to stored values
 */
struct ExtractionLimits {
    size_t symbolValue = 200;   ///< Code points kept of a symbol value
    size_t propertyValue = 500; ///< Code points kept of a tree property value
};

/**
 * @brief Extract facts from the full text of one file.
 *
 * Implementations keep no per-call state in the object, so a single instance
 * is shared by every worker thread.
 */
class IFactExtractor {
public:
    virtual ~IFactExtractor() = default;

    virtual ExtractedFacts extract(std::string_view content,
                                   const ExtractionLimits& limits) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Extractor for a format family. Recipe and config files share one.
 */
const IFactExtractor& extractorFor(FileFormat format);

/**
 * @brief Read, decode and extract one crawled file.
 *
 * Failures are per-file skips; the error message is the skip reason.
 */
Result<FileFacts> extractFile(const FileDescriptor& file,
                              const std::filesystem::path& projectRoot,
                              const ExtractionLimits& limits);

} // namespace bspidx::extraction

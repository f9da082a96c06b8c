#pragma once

#include <bspidx/extraction/fact_extractor.h>

namespace bspidx::extraction {

/**
 * @brief C headers: #define macros and #include edges. Continued defines
 * (trailing backslash) are joined into one value.
 */
class HeaderExtractor final : public IFactExtractor {
public:
    ExtractedFacts extract(std::string_view content,
                           const ExtractionLimits& limits) const override;

    std::string name() const override { return "header"; }
};

} // namespace bspidx::extraction

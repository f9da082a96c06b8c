#pragma once

#include <bspidx/extraction/fact_extractor.h>

namespace bspidx::extraction {

/**
 * @brief BitBake recipes (.bb, .bbappend, .inc) and configuration (.conf)
 *
 * Each line yields at most one fact, tried in this order:
 *  - variable assignment (=, ?=, ??=, :=, +=, =+, .=, =.) -> variable symbol
 *  - require/include directive -> include edge
 *  - inherit directive -> one edge per class, as classes/<name>.bbclass
 */
class RecipeExtractor final : public IFactExtractor {
public:
    ExtractedFacts extract(std::string_view content,
                           const ExtractionLimits& limits) const override;

    std::string name() const override { return "recipe"; }
};

} // namespace bspidx::extraction

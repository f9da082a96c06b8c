#pragma once

#include <bspidx/extraction/fact_extractor.h>

namespace bspidx::extraction {

/**
 * @brief Device tree sources (.dts, .dtsi)
 *
 * Single pass over the lines with an explicit stack of open scopes. Each
 * opened node gets a path: "&ref" nodes keep the reference token verbatim,
 * everything else is the parent path plus "/name" (the unit address is not
 * part of the path). A node's end line is back-filled when its scope closes.
 *
 * Statements are split on ';' so a node body may share a line with its
 * opening brace, and a property value may continue over several lines.
 * Closing braces with no open scope are counted in unbalancedCloses and
 * otherwise ignored.
 */
class DeviceTreeExtractor final : public IFactExtractor {
public:
    ExtractedFacts extract(std::string_view content,
                           const ExtractionLimits& limits) const override;

    std::string name() const override { return "devicetree"; }
};

} // namespace bspidx::extraction

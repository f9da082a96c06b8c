#include <bspidx/common/pattern_utils.h>
#include <bspidx/extraction/extraction_util.h>
#include <bspidx/extraction/recipe_extractor.h>

#include <regex>
#include <sstream>

namespace bspidx::extraction {

namespace {

// NAME[:override...] <op> ["']    the value runs from here to the next quote
const std::regex kAssignment(
    R"(^([A-Za-z_][A-Za-z0-9_-]*(?::[A-Za-z0-9_-]+)*)\s*(\?\?=|\?=|\+=|=\+|\.=|=\.|:=|=)\s*["']?)");
const std::regex kRequireInclude(R"(^(require|include)\s+["']?([^"'\s]+))");
const std::regex kInherit(R"(^inherit\s+)");

} // namespace

ExtractedFacts RecipeExtractor::extract(std::string_view content,
                                        const ExtractionLimits& limits) const {
    ExtractedFacts facts;

    forEachLine(content, [&](std::string_view raw, int lineNumber) {
        auto line = common::trim(raw);
        if (line.empty() || line.front() == '#')
            return;

        std::cmatch match;
        if (searchPrefix(line, match, kAssignment)) {
            auto value = line.substr(static_cast<size_t>(match.length(0)));
            value = value.substr(0, value.find_first_of("\"'"));
            facts.symbols.push_back({match[1].str(),
                                     truncateValue(common::rtrim(value), limits.symbolValue),
                                     SymbolKind::Variable, lineNumber});
            return;
        }

        if (searchPrefix(line, match, kRequireInclude)) {
            facts.includes.push_back({match[2].str(),
                                      match[1].str() == "require" ? IncludeKind::Require
                                                                  : IncludeKind::Include,
                                      lineNumber});
            return;
        }

        if (searchPrefix(line, match, kInherit)) {
            auto list = line.substr(static_cast<size_t>(match.length(0)));
            std::istringstream classes{std::string(list)};
            std::string cls;
            while (classes >> cls) {
                facts.includes.push_back(
                    {"classes/" + cls + ".bbclass", IncludeKind::Inherit, lineNumber});
            }
        }
    });

    return facts;
}

} // namespace bspidx::extraction

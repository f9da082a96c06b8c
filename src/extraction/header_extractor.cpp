#include <bspidx/common/pattern_utils.h>
#include <bspidx/extraction/extraction_util.h>
#include <bspidx/extraction/header_extractor.h>

#include <optional>
#include <regex>

namespace bspidx::extraction {

namespace {

// The value is whatever follows the name
const std::regex kDefine(R"(^#\s*define\s+([A-Za-z_][A-Za-z0-9_]*))");
const std::regex kInclude(R"(^#\s*include\s*[<"]([^>"]+)[>"])");

bool endsWithContinuation(std::string_view line) {
    return !line.empty() && line.back() == '\\';
}

std::string_view stripContinuation(std::string_view line) {
    if (endsWithContinuation(line))
        line.remove_suffix(1);
    return common::trim(line);
}

} // namespace

ExtractedFacts HeaderExtractor::extract(std::string_view content,
                                        const ExtractionLimits& limits) const {
    ExtractedFacts facts;

    // A define whose line ended in '\'; following lines are appended until one does not
    struct PendingDefine {
        std::string name;
        std::string value;
        int line;
    };
    std::optional<PendingDefine> pending;

    auto flush = [&]() {
        facts.symbols.push_back({pending->name, truncateValue(pending->value, limits.symbolValue),
                                 SymbolKind::Define, pending->line});
        pending.reset();
    };

    forEachLine(content, [&](std::string_view raw, int lineNumber) {
        auto line = common::trim(raw);

        if (pending) {
            auto part = stripContinuation(line);
            // Anything past what truncation keeps is not accumulated
            if (!part.empty() && pending->value.size() < limits.symbolValue * 4 + kMatchWindow) {
                if (!pending->value.empty())
                    pending->value.push_back(' ');
                pending->value.append(part);
            }
            if (!endsWithContinuation(line))
                flush();
            return;
        }

        if (line.empty() || line.front() != '#')
            return;

        std::cmatch match;
        if (searchPrefix(line, match, kDefine)) {
            auto rest = line.substr(static_cast<size_t>(match.length(0)));
            pending = PendingDefine{match[1].str(), std::string(stripContinuation(rest)),
                                    lineNumber};
            if (!endsWithContinuation(line))
                flush();
            return;
        }

        if (searchPrefix(line, match, kInclude)) {
            facts.includes.push_back(
                {match[1].str(), IncludeKind::PreprocessorInclude, lineNumber});
        }
    });

    // File ended inside a continued define
    if (pending)
        flush();

    return facts;
}

} // namespace bspidx::extraction

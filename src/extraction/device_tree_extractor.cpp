#include <bspidx/common/pattern_utils.h>
#include <bspidx/extraction/device_tree_extractor.h>
#include <bspidx/extraction/extraction_util.h>

#include <charconv>
#include <optional>
#include <regex>
#include <utility>
#include <vector>

namespace bspidx::extraction {

namespace {

const std::regex kPreprocessorInclude(R"(^#\s*include\s*[<"]([^>"]+)[>"])");
const std::regex kTreeInclude(R"re(^/include/\s*"([^"]+)")re");

// [label:] name[@address] {     name may also be &label or &{/path}
const std::regex kNodeOpen(
    R"(^(?:(\w+)\s*:\s*)?(&\{[^}]*\}|[^\s{};=]+?)(?:@([0-9a-fA-F]+))?\s*\{)");

// Leading name of a statement; the rest must be empty or start with '='
const std::regex kPropertyName(R"(^[\w,.+?#-]+)");
const std::regex kPropertyStart(R"(^[\w,.+?#-]+\s*=)");

const std::regex kLabelReference(R"(&(\w+))");
const std::regex kGpioCell(R"(<\s*&(\w+)\s+(\d+)(?:\s+(\w+))?\s*>)");
const std::regex kGpioSuffix(R"(-?gpios?$)", std::regex::icase);

// Offset of the ';' ending the first statement, skipping quoted strings.
size_t findStatementEnd(std::string_view text) {
    bool quoted = false;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quoted) {
            if (c == '\\')
                ++i;
            else if (c == '"')
                quoted = false;
        } else if (c == '"') {
            quoted = true;
        } else if (c == ';') {
            return i;
        }
    }
    return std::string_view::npos;
}

// Offset where a '//' or '/*' comment starts outside quotes.
size_t findCommentStart(std::string_view text) {
    bool quoted = false;
    for (size_t i = 0; i + 1 < text.size(); ++i) {
        char c = text[i];
        if (quoted) {
            if (c == '\\')
                ++i;
            else if (c == '"')
                quoted = false;
        } else if (c == '"') {
            quoted = true;
        } else if (c == '/' && (text[i + 1] == '/' || text[i + 1] == '*')) {
            return i;
        }
    }
    return std::string_view::npos;
}

std::string gpioDirection(std::string_view flags) {
    if (flags.empty())
        return {};
    if (flags.find("ACTIVE_LOW") != std::string_view::npos)
        return "active-low";
    if (flags.find("ACTIVE_HIGH") != std::string_view::npos)
        return "active-high";
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(flags.data(), flags.data() + flags.size(), value);
    if (ec != std::errc{} || ptr != flags.data() + flags.size())
        return {};
    return (value & 1u) ? "active-low" : "active-high";
}

/**
 * Per-call scan state. Kept out of the extractor object so concurrent
 * extract() calls never share it.
 */
class TreeScanner {
public:
    TreeScanner(ExtractedFacts& facts, const ExtractionLimits& limits)
        : facts_(facts), limits_(limits) {}

    void scanLine(std::string_view raw, int lineNumber);
    void finish();

private:
    struct OpenScope {
        std::string parentPath;
        int line;
    };

    struct PendingStatement {
        std::string text;
        int line;
    };

    std::string stripComments(std::string_view line);
    void scanSegments(std::string_view rest, int lineNumber);
    void openNode(const std::cmatch& match, int lineNumber);
    void closeScope(int lineNumber);
    void addStatement(std::string_view statement, int lineNumber);
    void addGpioPins(const std::string& property, const std::string& value, int lineNumber);
    std::string childPath(const std::string& name) const;
    // Code points may take four bytes; the slack keeps label refs near the cut
    size_t pendingCap() const { return limits_.propertyValue * 4 + kMatchWindow; }

    ExtractedFacts& facts_;
    const ExtractionLimits& limits_;
    std::vector<OpenScope> stack_;
    std::string currentPath_;
    std::optional<PendingStatement> pending_;
    bool inBlockComment_ = false;
};

// A closed block comment reads as one space; "//" ends the line.
std::string TreeScanner::stripComments(std::string_view line) {
    std::string kept;
    while (!line.empty()) {
        if (inBlockComment_) {
            size_t close = line.find("*/");
            if (close == std::string_view::npos)
                break;
            inBlockComment_ = false;
            kept.resize(common::rtrim(kept).size());
            kept.push_back(' ');
            line = common::ltrim(line.substr(close + 2));
            continue;
        }

        size_t start = findCommentStart(line);
        if (start == std::string_view::npos) {
            kept.append(line);
            break;
        }
        kept.append(line.substr(0, start));
        if (line[start + 1] == '/')
            break;
        inBlockComment_ = true;
        line = line.substr(start + 2);
    }
    return std::string(common::trim(kept));
}

void TreeScanner::scanLine(std::string_view raw, int lineNumber) {
    const std::string stripped = stripComments(common::trim(raw));
    std::string_view line = stripped;
    if (line.empty())
        return;

    if (pending_) {
        // A closing brace means the value never terminated; drop it and scan the line normally
        if (line.front() != '}') {
            size_t end = findStatementEnd(line);
            // Past the cap only the terminating ';' is still looked for
            if (pending_->text.size() < pendingCap()) {
                pending_->text.push_back(' ');
                pending_->text.append(line.substr(0, end));
            }
            if (end == std::string_view::npos)
                return;
            auto statement = std::move(*pending_);
            pending_.reset();
            addStatement(statement.text, statement.line);
            scanSegments(common::ltrim(line.substr(end + 1)), lineNumber);
            return;
        }
        pending_.reset();
    }

    std::cmatch match;
    if (searchPrefix(line, match, kPreprocessorInclude)) {
        facts_.includes.push_back({match[1].str(), IncludeKind::PreprocessorInclude, lineNumber});
        return;
    }
    if (searchPrefix(line, match, kTreeInclude)) {
        facts_.includes.push_back({match[1].str(), IncludeKind::TreeInclude, lineNumber});
        return;
    }

    scanSegments(line, lineNumber);
}

void TreeScanner::scanSegments(std::string_view rest, int lineNumber) {
    while (!rest.empty()) {
        if (rest.front() == '}') {
            closeScope(lineNumber);
            rest = common::ltrim(rest.substr(1));
            if (!rest.empty() && rest.front() == ';')
                rest = common::ltrim(rest.substr(1));
            continue;
        }

        std::cmatch match;
        if (searchPrefix(rest, match, kNodeOpen)) {
            openNode(match, lineNumber);
            rest = common::ltrim(rest.substr(static_cast<size_t>(match.length(0))));
            continue;
        }

        size_t end = findStatementEnd(rest);
        if (end == std::string_view::npos) {
            // Multi-line value: remember it while a scope is open
            if (!currentPath_.empty() && searchPrefix(rest, match, kPropertyStart))
                pending_ = PendingStatement{std::string(rest), lineNumber};
            return;
        }
        addStatement(rest.substr(0, end), lineNumber);
        rest = common::ltrim(rest.substr(end + 1));
    }
}

std::string TreeScanner::childPath(const std::string& name) const {
    if (name.starts_with("&") || name == "/")
        return name;
    if (currentPath_.empty() || currentPath_ == "/")
        return "/" + name;
    return currentPath_ + "/" + name;
}

void TreeScanner::openNode(const std::cmatch& match, int lineNumber) {
    std::string label = match[1].matched ? match[1].str() : std::string();
    std::string name = match[2].str();
    std::string address = match[3].matched ? match[3].str() : std::string();

    std::string path = childPath(name);

    stack_.push_back({currentPath_, lineNumber});
    facts_.nodes.push_back({path, name, label, address, currentPath_, lineNumber, lineNumber});
    currentPath_ = path;

    if (!label.empty()) {
        facts_.symbols.push_back(
            {label, truncateValue(path, limits_.symbolValue), SymbolKind::Label, lineNumber});
    }
}

void TreeScanner::closeScope(int lineNumber) {
    if (stack_.empty()) {
        ++facts_.unbalancedCloses;
        return;
    }

    OpenScope scope = std::move(stack_.back());
    stack_.pop_back();

    // Same path may have been opened before (override blocks); the latest one is closing
    for (auto it = facts_.nodes.rbegin(); it != facts_.nodes.rend(); ++it) {
        if (it->path == currentPath_) {
            it->endLine = lineNumber;
            break;
        }
    }
    currentPath_ = std::move(scope.parentPath);
}

void TreeScanner::addStatement(std::string_view statement, int lineNumber) {
    if (currentPath_.empty())
        return;

    statement = common::trim(statement);
    std::cmatch match;
    if (!searchPrefix(statement, match, kPropertyName))
        return;

    std::string name = match[0].str();
    auto rest = common::ltrim(statement.substr(static_cast<size_t>(match.length(0))));
    if (!rest.empty() && rest.front() != '=')
        return;
    std::string value = rest.empty() ? std::string() : std::string(common::trim(rest.substr(1)));

    facts_.properties.push_back(
        {currentPath_, name, truncateValue(value, limits_.propertyValue), lineNumber});

    for (auto it = std::sregex_iterator(value.begin(), value.end(), kLabelReference);
         it != std::sregex_iterator(); ++it) {
        std::string ref = (*it)[1].str();
        facts_.symbols.push_back({"&" + ref, ref, SymbolKind::LabelReference, lineNumber});
    }

    if (!value.empty() &&
        (name.find("gpio") != std::string::npos || name.find("GPIO") != std::string::npos)) {
        addGpioPins(name, value, lineNumber);
    }
}

void TreeScanner::addGpioPins(const std::string& property, const std::string& value,
                              int lineNumber) {
    for (auto it = std::sregex_iterator(value.begin(), value.end(), kGpioCell);
         it != std::sregex_iterator(); ++it) {
        const auto& cell = *it;
        int pin = 0;
        std::string pinText = cell[2].str();
        auto [ptr, ec] = std::from_chars(pinText.data(), pinText.data() + pinText.size(), pin);
        if (ec != std::errc{})
            continue;
        facts_.gpioPins.push_back({cell[1].str(), pin,
                                   std::regex_replace(property, kGpioSuffix, ""), property,
                                   gpioDirection(cell[3].matched ? cell[3].str() : ""),
                                   lineNumber});
    }
}

void TreeScanner::finish() {
    // Scopes still open at EOF keep their provisional end line
    pending_.reset();
}

} // namespace

ExtractedFacts DeviceTreeExtractor::extract(std::string_view content,
                                            const ExtractionLimits& limits) const {
    ExtractedFacts facts;
    TreeScanner scanner(facts, limits);
    forEachLine(content, [&](std::string_view line, int lineNumber) {
        scanner.scanLine(line, lineNumber);
    });
    scanner.finish();
    return facts;
}

} // namespace bspidx::extraction

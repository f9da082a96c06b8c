#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bspidx::extraction {

/**
 * @brief Format family a file is classified into by its extension
 */
enum class FileFormat { Recipe, Config, Header, TreeSource };

/**
 * @brief Kind tag of an extracted symbol
 */
enum class SymbolKind { Variable, Label, LabelReference, Define };

/**
 * @brief How one file references another
 */
enum class IncludeKind { Require, Include, Inherit, PreprocessorInclude, TreeInclude };

// Stored tags; the desktop consumer of the index reads these exact strings.
constexpr const char* toString(FileFormat format) {
    switch (format) {
        case FileFormat::Recipe:
            return "recipe";
        case FileFormat::Config:
            return "config";
        case FileFormat::Header:
            return "header";
        case FileFormat::TreeSource:
            return "dts";
    }
    return "unknown";
}

constexpr const char* toString(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Variable:
            return "variable";
        case SymbolKind::Label:
            return "label";
        case SymbolKind::LabelReference:
            return "label_ref";
        case SymbolKind::Define:
            return "define";
    }
    return "unknown";
}

constexpr const char* toString(IncludeKind kind) {
    switch (kind) {
        case IncludeKind::Require:
            return "require";
        case IncludeKind::Include:
            return "include";
        case IncludeKind::Inherit:
            return "inherit";
        case IncludeKind::PreprocessorInclude:
            return "#include";
        case IncludeKind::TreeInclude:
            return "/include/";
    }
    return "unknown";
}

/**
 * @brief Map a file extension (with dot, any case) to its format family
 */
std::optional<FileFormat> formatForExtension(std::string_view extension);

/**
 * @brief A file found by the crawler, not yet read
 */
struct FileDescriptor {
    std::string path; ///< Absolute path on disk
    std::string name; ///< Base name
    FileFormat format;
};

struct FileRecord {
    std::string path; ///< Relative to the project root, unique within a snapshot
    std::string name;
    FileFormat format;
    int64_t size = 0;
    int64_t mtime = 0; ///< Seconds since epoch
};

struct SymbolFact {
    std::string name;
    std::string value;
    SymbolKind kind;
    int line;
};

struct IncludeFact {
    std::string target; ///< As written in the source, unresolved
    IncludeKind kind;
    int line;
};

struct TreeNodeFact {
    std::string path;       ///< Computed hierarchical path, or the literal &override token
    std::string name;
    std::string label;      ///< Empty when the node has no label
    std::string address;    ///< Hex unit address without '@', empty when absent
    std::string parentPath; ///< Path of the scope open when the node was entered, empty at top level
    int startLine;
    int endLine;
};

struct TreePropertyFact {
    std::string nodePath; ///< Path of the node that was open on the line
    std::string name;
    std::string value;
    int line;
};

struct GpioPinFact {
    std::string controller;
    int pin;
    std::string label;
    std::string function;
    std::string direction; ///< "active-low", "active-high" or empty when no flags cell
    int line;
};

/**
 * @brief Everything extracted from one file's content
 */
struct ExtractedFacts {
    std::vector<SymbolFact> symbols;
    std::vector<IncludeFact> includes;
    std::vector<TreeNodeFact> nodes;
    std::vector<TreePropertyFact> properties;
    std::vector<GpioPinFact> gpioPins;
    int unbalancedCloses = 0; ///< Scope closes seen with no open scope
};

/**
 * @brief One file's record plus its facts; the unit handed to the store writer
 */
struct FileFacts {
    FileRecord file;
    ExtractedFacts facts;
};

} // namespace bspidx::extraction

#include <bspidx/common/pattern_utils.h>
#include <bspidx/config/config_helpers.h>
#include <bspidx/config/indexer_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <string_view>

namespace bspidx::config {

namespace {

Result<size_t> parseCount(const std::string& raw, const char* what) {
    size_t value = 0;
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value == 0) {
        return Error{ErrorCode::InvalidArgument,
                     std::string(what) + " must be a positive integer, got '" + raw + "'"};
    }
    return value;
}

Result<void> assignCount(size_t& target, const std::string& raw, const char* what) {
    if (raw.empty())
        return {};
    auto parsed = parseCount(raw, what);
    if (!parsed)
        return parsed.error();
    target = parsed.value();
    return {};
}

} // namespace

std::filesystem::path resolvePath(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec)
        return path.lexically_normal();
    auto resolved = std::filesystem::weakly_canonical(absolute, ec);
    // Unreadable prefix; fall back to a purely lexical form
    return ec ? absolute.lexically_normal() : resolved;
}

std::filesystem::path defaultOutputPath(const std::filesystem::path& projectRoot) {
    return projectRoot / ".bsp-index" / "index.bspidx";
}

std::filesystem::path summaryPathFor(const std::filesystem::path& outputPath) {
    return outputPath.parent_path() / "meta.json";
}

Result<void> applyConfigFile(IndexerConfig& config, const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
    }

    const std::string section = "indexer";
    if (auto r = assignCount(config.batchSize, parse_config_value(path, section, "batch_size"),
                             "batch_size");
        !r)
        return r;
    if (auto r = assignCount(config.workers, parse_config_value(path, section, "workers"),
                             "workers");
        !r)
        return r;
    if (auto r = assignCount(config.symbolValueLimit,
                             parse_config_value(path, section, "symbol_value_limit"),
                             "symbol_value_limit");
        !r)
        return r;
    if (auto r = assignCount(config.propertyValueLimit,
                             parse_config_value(path, section, "property_value_limit"),
                             "property_value_limit");
        !r)
        return r;

    if (auto level = parse_config_value(path, section, "log_level"); !level.empty())
        config.logLevel = level;

    if (auto exclude = parse_config_value(path, section, "exclude"); !exclude.empty()) {
        auto patterns = common::split_patterns(exclude);
        if (!patterns.empty())
            config.excludePatterns = std::move(patterns);
    }

    spdlog::debug("Loaded indexer config from {}", path.string());
    return {};
}

Result<void> applyEnvironment(IndexerConfig& config) {
    if (const char* level = std::getenv("BSPIDX_LOG_LEVEL"); level && *level)
        config.logLevel = level;
    if (const char* workers = std::getenv("BSPIDX_WORKERS"); workers && *workers) {
        if (auto r = assignCount(config.workers, workers, "BSPIDX_WORKERS"); !r)
            return r;
    }
    if (const char* batch = std::getenv("BSPIDX_BATCH_SIZE"); batch && *batch) {
        if (auto r = assignCount(config.batchSize, batch, "BSPIDX_BATCH_SIZE"); !r)
            return r;
    }
    return {};
}

Result<void> validate(const IndexerConfig& config) {
    if (config.projectRoot.empty()) {
        return Error{ErrorCode::InvalidArgument, "Project path is required"};
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(config.projectRoot, ec)) {
        return Error{ErrorCode::FileNotFound,
                     "Project path is not a directory: " + config.projectRoot.string()};
    }
    if (config.batchSize == 0 || config.workers == 0) {
        return Error{ErrorCode::InvalidArgument, "batch size and worker count must be positive"};
    }
    if (config.symbolValueLimit == 0 || config.propertyValueLimit == 0) {
        return Error{ErrorCode::InvalidArgument, "value limits must be positive"};
    }
    static constexpr std::array<std::string_view, 9> kLevels = {
        "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
    if (std::find(kLevels.begin(), kLevels.end(), config.logLevel) == kLevels.end()) {
        return Error{ErrorCode::InvalidArgument, "Unknown log level '" + config.logLevel + "'"};
    }
    return {};
}

} // namespace bspidx::config

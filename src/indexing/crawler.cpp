#include <bspidx/common/pattern_utils.h>
#include <bspidx/indexing/crawler.h>
#include <spdlog/spdlog.h>

namespace bspidx::indexing {

namespace fs = std::filesystem;

Crawler::Crawler(fs::path root, std::vector<std::string> excludePatterns)
    : root_(std::move(root)), excludePatterns_(std::move(excludePatterns)) {}

bool Crawler::isExcluded(std::string_view relativeDir) const {
    // "*/tmp/work/*" must catch tmp/work itself, not only what lies below it
    std::string candidate(relativeDir);
    if (candidate.empty() || candidate.back() != '/')
        candidate.push_back('/');
    return common::matches_any(candidate, excludePatterns_) ||
           common::matches_any("/" + candidate, excludePatterns_);
}

Result<std::vector<extraction::FileDescriptor>> Crawler::crawl() {
    std::vector<extraction::FileDescriptor> files;
    stats_ = {};

    // Explicit directory stack: a failure inside one directory only abandons that directory
    std::vector<fs::path> pending{root_};
    while (!pending.empty()) {
        fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            if (dir == root_) {
                return Error{ErrorCode::FileNotFound,
                             "Cannot read project directory " + root_.string() + ": " +
                                 ec.message()};
            }
            spdlog::debug("Skipping unreadable directory {}: {}", dir.string(), ec.message());
            ++stats_.entriesSkipped;
            continue;
        }

        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                ++stats_.entriesSkipped;
                break;
            }

            const auto& entry = *it;
            std::error_code statEc;

            // Symlinked directories are not followed
            if (entry.is_symlink(statEc) && entry.is_directory(statEc))
                continue;

            if (entry.is_directory(statEc)) {
                auto relative = entry.path().lexically_relative(root_).generic_string();
                if (isExcluded(relative)) {
                    ++stats_.directoriesPruned;
                    continue;
                }
                pending.push_back(entry.path());
                continue;
            }

            if (!entry.is_regular_file(statEc)) {
                if (statEc)
                    ++stats_.entriesSkipped;
                continue;
            }

            auto format = extraction::formatForExtension(entry.path().extension().string());
            if (!format)
                continue;

            files.push_back({entry.path().string(), entry.path().filename().string(), *format});
        }
    }

    spdlog::debug("Crawl of {} found {} files, pruned {} directories", root_.string(),
                  files.size(), stats_.directoriesPruned);
    return files;
}

} // namespace bspidx::indexing

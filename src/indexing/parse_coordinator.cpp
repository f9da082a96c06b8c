#include <bspidx/indexing/parse_coordinator.h>

#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <exception>
#include <future>
#include <optional>
#include <string>

namespace bspidx::indexing {

struct ParseCoordinator::Outcome {
    std::optional<extraction::FileFacts> facts;
    std::string skipReason;
};

ParseCoordinator::ParseCoordinator(metadata::IndexStore& store, std::filesystem::path projectRoot,
                                   size_t workers, size_t batchSize,
                                   extraction::ExtractionLimits limits)
    : store_(store), projectRoot_(std::move(projectRoot)), workers_(std::max<size_t>(workers, 1)),
      batchSize_(std::max<size_t>(batchSize, 1)), limits_(limits),
      pool_(std::make_unique<boost::asio::thread_pool>(workers_)) {
    spdlog::debug("Parse pool started with {} workers, batch size {}", workers_, batchSize_);
}

ParseCoordinator::~ParseCoordinator() {
    if (pool_) {
        pool_->join();
    }
}

ParseCoordinator::Outcome
ParseCoordinator::processFile(const extraction::FileDescriptor& file) const {
    Outcome outcome;
    try {
        auto result = extraction::extractFile(file, projectRoot_, limits_);
        if (result) {
            outcome.facts = std::move(result).value();
        } else {
            outcome.skipReason = result.error().message;
        }
    } catch (const std::exception& e) {
        outcome.skipReason = e.what();
    }
    return outcome;
}

Result<IndexStats> ParseCoordinator::run(const std::vector<extraction::FileDescriptor>& files) {
    IndexStats stats;
    const size_t total = files.size();
    size_t processed = 0;

    for (size_t begin = 0; begin < total; begin += batchSize_) {
        const size_t end = std::min(begin + batchSize_, total);

        std::vector<std::future<Outcome>> pending;
        pending.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            auto task = std::make_shared<std::packaged_task<Outcome()>>(
                [this, &file = files[i]]() { return processFile(file); });
            pending.push_back(task->get_future());
            boost::asio::post(*pool_, [task]() { (*task)(); });
        }

        // Results are collected in dispatch order; arrival order is irrelevant to the store
        std::vector<extraction::FileFacts> batch;
        batch.reserve(pending.size());
        for (size_t i = 0; i < pending.size(); ++i) {
            Outcome outcome = pending[i].get();
            if (!outcome.facts) {
                spdlog::debug("Skipped {}: {}", files[begin + i].path, outcome.skipReason);
                ++stats.skipped;
                continue;
            }
            if (outcome.facts->facts.unbalancedCloses > 0) {
                spdlog::debug("{}: {} unbalanced closing braces", outcome.facts->file.path,
                              outcome.facts->facts.unbalancedCloses);
                stats.anomalies += static_cast<uint64_t>(outcome.facts->facts.unbalancedCloses);
            }
            batch.push_back(std::move(*outcome.facts));
        }

        if (!batch.empty()) {
            auto written = store_.writeBatch(batch);
            if (!written) {
                spdlog::error("Aborting after {}/{} files: {}", processed, total,
                              written.error().message);
                return written.error();
            }
            stats.written += written.value();
        }

        processed = end;
        spdlog::info("Progress: {}/{} ({:.1f}%)", processed, total,
                     static_cast<double>(processed) * 100.0 / static_cast<double>(total));
        if (progress_) {
            progress_(processed, total);
        }
    }

    return stats;
}

} // namespace bspidx::indexing

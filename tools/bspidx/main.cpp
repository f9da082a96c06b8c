#include <bspidx/config/indexer_config.h>
#include <bspidx/indexing/bsp_indexer.h>
#include <bspidx/version.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <exception>
#include <iostream>
#include <string>

namespace {

void setup_logging() {
    auto logger = spdlog::stdout_color_mt("bspidx");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(spdlog::level::info);
}

} // namespace

int main(int argc, char* argv[]) {
    setup_logging();

    CLI::App app{"BSP source indexer - builds a searchable index of a Yocto/BSP tree", "bspidx"};
    app.set_version_flag("--version", bspidx::version::string_v);

    std::string projectPath;
    std::string outputPath;
    std::string configPath;
    size_t workers = 0;
    size_t batchSize = 0;
    std::string logLevel;

    app.add_option("project_path", projectPath, "Root of the BSP project to index")->required();
    app.add_option("-o,--output", outputPath,
                   "Index file (default: <project>/.bsp-index/index.bspidx)");
    app.add_option("-c,--config", configPath, "Config file with an [indexer] section")
        ->check(CLI::ExistingFile);
    auto* workersOpt = app.add_option("-j,--workers", workers, "Parallel parse workers")
                           ->check(CLI::PositiveNumber);
    auto* batchOpt = app.add_option("-b,--batch-size", batchSize, "Files committed per transaction")
                         ->check(CLI::PositiveNumber);
    auto* levelOpt = app.add_option("--log-level", logLevel,
                                    "Log level (trace/debug/info/warn/error)");

    CLI11_PARSE(app, argc, argv);

    try {
        // Precedence: command line > environment > config file > defaults
        bspidx::config::IndexerConfig config;
        if (!configPath.empty()) {
            if (auto r = bspidx::config::applyConfigFile(config, configPath); !r) {
                spdlog::error("{}", r.error().message);
                return 1;
            }
        }
        if (auto r = bspidx::config::applyEnvironment(config); !r) {
            spdlog::error("{}", r.error().message);
            return 1;
        }

        config.projectRoot = bspidx::config::resolvePath(projectPath);
        if (!outputPath.empty())
            config.outputPath = bspidx::config::resolvePath(outputPath);
        if (workersOpt->count() > 0)
            config.workers = workers;
        if (batchOpt->count() > 0)
            config.batchSize = batchSize;
        if (levelOpt->count() > 0)
            config.logLevel = logLevel;

        if (auto r = bspidx::config::validate(config); !r) {
            spdlog::error("{}", r.error().message);
            return 1;
        }
        spdlog::set_level(spdlog::level::from_str(config.logLevel));

        bspidx::indexing::BspIndexer indexer(std::move(config));
        auto summary = indexer.run();
        if (!summary) {
            spdlog::error("Indexing failed ({}): {}", summary.error().code,
                          summary.error().message);
            return 1;
        }

        std::cout << "Index saved: " << summary.value().outputPath.string() << std::endl;
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Indexing failed: {}", e.what());
        return 1;
    }
}

#include <gtest/gtest.h>
#include <bspidx/config/config_helpers.h>
#include <bspidx/config/indexer_config.h>

#include "../../common/test_helpers.h"

#include <cstdlib>
#include <filesystem>

using namespace bspidx;
using namespace bspidx::config;

class IndexerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tests::make_temp_dir("bspidx_config_");
        ::unsetenv("BSPIDX_LOG_LEVEL");
        ::unsetenv("BSPIDX_WORKERS");
        ::unsetenv("BSPIDX_BATCH_SIZE");
    }

    void TearDown() override {
        ::unsetenv("BSPIDX_LOG_LEVEL");
        ::unsetenv("BSPIDX_WORKERS");
        ::unsetenv("BSPIDX_BATCH_SIZE");
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
};

TEST_F(IndexerConfigTest, Defaults) {
    IndexerConfig config;
    EXPECT_EQ(config.batchSize, 100u);
    EXPECT_EQ(config.workers, 8u);
    EXPECT_EQ(config.symbolValueLimit, 200u);
    EXPECT_EQ(config.propertyValueLimit, 500u);
    EXPECT_EQ(config.logLevel, "info");
    ASSERT_EQ(config.excludePatterns.size(), 4u);
    EXPECT_EQ(config.excludePatterns[0], "*/tmp/work/*");
    EXPECT_EQ(config.excludePatterns[3], "*/downloads/*");
}

TEST_F(IndexerConfigTest, ResolvePathRemovesDotDotAndSymlinks) {
    auto real = dir_ / "real";
    std::filesystem::create_directories(real / "sub");
    std::filesystem::create_directory_symlink(real, dir_ / "link");
    const auto expected = std::filesystem::canonical(real);

    EXPECT_EQ(resolvePath(real / "sub" / ".."), expected);
    EXPECT_EQ(resolvePath(dir_ / "link"), expected);
    EXPECT_EQ(resolvePath(dir_ / "link" / "sub" / ".." / "out.bspidx"), expected / "out.bspidx");
    EXPECT_TRUE(resolvePath("relative/dir").is_absolute());
}

TEST_F(IndexerConfigTest, DefaultOutputLivesUnderProject) {
    auto out = defaultOutputPath("/work/bsp");
    EXPECT_EQ(out, std::filesystem::path("/work/bsp/.bsp-index/index.bspidx"));
    EXPECT_EQ(summaryPathFor(out), std::filesystem::path("/work/bsp/.bsp-index/meta.json"));
}

TEST_F(IndexerConfigTest, ParseConfigValueHandlesSectionsAndComments) {
    auto path = tests::write_file(dir_ / "config.toml", R"(
# top comment
[other]
workers = 99

[indexer]
workers = 4  # inline comment
log_level = "debug"
)");
    EXPECT_EQ(parse_config_value(path, "indexer", "workers"), "4");
    EXPECT_EQ(parse_config_value(path, "indexer", "log_level"), "debug");
    EXPECT_EQ(parse_config_value(path, "other", "workers"), "99");
    EXPECT_EQ(parse_config_value(path, "indexer", "missing"), "");
}

TEST_F(IndexerConfigTest, ApplyConfigFileOverlaysValues) {
    auto path = tests::write_file(dir_ / "bspidx.toml", R"([indexer]
batch_size = 25
workers = 3
exclude = ["*/build/*", "*/.repo/*"]
symbol_value_limit = 64
property_value_limit = 128
log_level = "warn"
)");
    IndexerConfig config;
    auto r = applyConfigFile(config, path);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(config.batchSize, 25u);
    EXPECT_EQ(config.workers, 3u);
    EXPECT_EQ(config.symbolValueLimit, 64u);
    EXPECT_EQ(config.propertyValueLimit, 128u);
    EXPECT_EQ(config.logLevel, "warn");
    ASSERT_EQ(config.excludePatterns.size(), 2u);
    EXPECT_EQ(config.excludePatterns[1], "*/.repo/*");
}

TEST_F(IndexerConfigTest, ApplyConfigFileKeepsUnsetKeys) {
    auto path = tests::write_file(dir_ / "partial.toml", "[indexer]\nworkers = 2\n");
    IndexerConfig config;
    ASSERT_TRUE(applyConfigFile(config, path));
    EXPECT_EQ(config.workers, 2u);
    EXPECT_EQ(config.batchSize, 100u);
    EXPECT_EQ(config.excludePatterns, IndexerConfig::defaultExcludePatterns());
}

TEST_F(IndexerConfigTest, ApplyConfigFileRejectsBadNumbers) {
    auto path = tests::write_file(dir_ / "bad.toml", "[indexer]\nbatch_size = lots\n");
    IndexerConfig config;
    auto r = applyConfigFile(config, path);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);

    auto zero = tests::write_file(dir_ / "zero.toml", "[indexer]\nworkers = 0\n");
    EXPECT_FALSE(applyConfigFile(config, zero));
}

TEST_F(IndexerConfigTest, ApplyConfigFileMissingFile) {
    IndexerConfig config;
    auto r = applyConfigFile(config, dir_ / "nope.toml");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::FileNotFound);
}

TEST_F(IndexerConfigTest, EnvironmentOverridesFile) {
    auto path = tests::write_file(dir_ / "env.toml", "[indexer]\nworkers = 2\nbatch_size = 10\n");
    IndexerConfig config;
    ASSERT_TRUE(applyConfigFile(config, path));

    ::setenv("BSPIDX_WORKERS", "6", 1);
    ::setenv("BSPIDX_LOG_LEVEL", "debug", 1);
    ASSERT_TRUE(applyEnvironment(config));
    EXPECT_EQ(config.workers, 6u);
    EXPECT_EQ(config.batchSize, 10u);
    EXPECT_EQ(config.logLevel, "debug");

    ::setenv("BSPIDX_BATCH_SIZE", "-5", 1);
    auto r = applyEnvironment(config);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST_F(IndexerConfigTest, ValidateChecksProjectAndLimits) {
    IndexerConfig config;
    EXPECT_FALSE(validate(config));

    config.projectRoot = dir_ / "does-not-exist";
    auto missing = validate(config);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);

    config.projectRoot = dir_;
    EXPECT_TRUE(validate(config));

    config.logLevel = "loud";
    EXPECT_FALSE(validate(config));
    config.logLevel = "warn";

    config.batchSize = 0;
    EXPECT_FALSE(validate(config));
}

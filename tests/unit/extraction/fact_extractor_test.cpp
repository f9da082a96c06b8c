#include <gtest/gtest.h>
#include <bspidx/extraction/fact_extractor.h>

#include "../../common/test_helpers.h"

#include <filesystem>
#include <string>

using namespace bspidx;
using namespace bspidx::extraction;

TEST(FormatForExtensionTest, ClassifiesKnownExtensions) {
    EXPECT_EQ(formatForExtension(".bb"), FileFormat::Recipe);
    EXPECT_EQ(formatForExtension(".bbappend"), FileFormat::Recipe);
    EXPECT_EQ(formatForExtension(".inc"), FileFormat::Recipe);
    EXPECT_EQ(formatForExtension(".conf"), FileFormat::Config);
    EXPECT_EQ(formatForExtension(".h"), FileFormat::Header);
    EXPECT_EQ(formatForExtension(".dts"), FileFormat::TreeSource);
    EXPECT_EQ(formatForExtension(".DTSI"), FileFormat::TreeSource);
    EXPECT_FALSE(formatForExtension(".c").has_value());
    EXPECT_FALSE(formatForExtension("").has_value());
}

TEST(FormatForExtensionTest, StoredTags) {
    EXPECT_STREQ(toString(FileFormat::TreeSource), "dts");
    EXPECT_STREQ(toString(FileFormat::Config), "config");
    EXPECT_STREQ(toString(SymbolKind::LabelReference), "label_ref");
    EXPECT_STREQ(toString(IncludeKind::PreprocessorInclude), "#include");
    EXPECT_STREQ(toString(IncludeKind::TreeInclude), "/include/");
}

TEST(ExtractorDispatchTest, RecipeAndConfigShareAnExtractor) {
    EXPECT_EQ(&extractorFor(FileFormat::Recipe), &extractorFor(FileFormat::Config));
    EXPECT_EQ(extractorFor(FileFormat::Header).name(), "header");
    EXPECT_EQ(extractorFor(FileFormat::TreeSource).name(), "devicetree");
}

class ExtractFileTest : public ::testing::Test {
protected:
    void SetUp() override { root_ = tests::make_temp_dir("bspidx_extract_"); }
    void TearDown() override { std::filesystem::remove_all(root_); }

    std::filesystem::path root_;
};

TEST_F(ExtractFileTest, ReadsRecordAndFacts) {
    auto path = tests::write_file(root_ / "conf" / "local.conf", "MACHINE ?= \"imx8mpevk\"\n");
    FileDescriptor desc{path.string(), "local.conf", FileFormat::Config};

    auto result = extractFile(desc, root_, {});
    ASSERT_TRUE(result) << result.error().message;
    const auto& facts = result.value();
    EXPECT_EQ(facts.file.path, "conf/local.conf");
    EXPECT_EQ(facts.file.name, "local.conf");
    EXPECT_EQ(facts.file.format, FileFormat::Config);
    EXPECT_EQ(facts.file.size, 23);
    EXPECT_GT(facts.file.mtime, 0);
    ASSERT_EQ(facts.facts.symbols.size(), 1u);
    EXPECT_EQ(facts.facts.symbols[0].value, "imx8mpevk");
}

TEST_F(ExtractFileTest, InvalidUtf8IsDropped) {
    auto path = tests::write_file(root_ / "a.bb", "DESCRIPTION = \"caf\xE9 board\"\n");
    FileDescriptor desc{path.string(), "a.bb", FileFormat::Recipe};

    auto result = extractFile(desc, root_, {});
    ASSERT_TRUE(result);
    ASSERT_EQ(result.value().facts.symbols.size(), 1u);
    EXPECT_EQ(result.value().facts.symbols[0].value, "caf board");
}

TEST_F(ExtractFileTest, MissingFileIsASkip) {
    FileDescriptor desc{(root_ / "gone.h").string(), "gone.h", FileFormat::Header};
    auto result = extractFile(desc, root_, {});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::FileNotFound);
    EXPECT_NE(result.error().message.find("gone.h"), std::string::npos);
}

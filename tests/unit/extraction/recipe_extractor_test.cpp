#include <gtest/gtest.h>
#include <bspidx/extraction/recipe_extractor.h>

#include <string>

using namespace bspidx::extraction;

class RecipeExtractorTest : public ::testing::Test {
protected:
    ExtractedFacts extract(const std::string& content, ExtractionLimits limits = {}) {
        return extractor_.extract(content, limits);
    }

    RecipeExtractor extractor_;
};

TEST_F(RecipeExtractorTest, SimpleAssignment) {
    auto facts = extract("FOO = \"bar\"\n");
    ASSERT_EQ(facts.symbols.size(), 1u);
    EXPECT_EQ(facts.symbols[0].name, "FOO");
    EXPECT_EQ(facts.symbols[0].value, "bar");
    EXPECT_EQ(facts.symbols[0].kind, SymbolKind::Variable);
    EXPECT_EQ(facts.symbols[0].line, 1);
    EXPECT_TRUE(facts.includes.empty());
}

TEST_F(RecipeExtractorTest, AssignmentOperators) {
    auto facts = extract("A ?= \"1\"\n"
                         "B ??= '2'\n"
                         "C += \"3\"\n"
                         "D := 4\n"
                         "E .= \"5\"\n"
                         "F =+ \"6\"\n"
                         "SRC_URI:append:mx8 = \"file://fix.patch\"\n"
                         "PREFERRED_PROVIDER_virtual-kernel=\"linux-imx\"\n");
    ASSERT_EQ(facts.symbols.size(), 8u);
    EXPECT_EQ(facts.symbols[0].value, "1");
    EXPECT_EQ(facts.symbols[1].name, "B");
    EXPECT_EQ(facts.symbols[1].value, "2");
    EXPECT_EQ(facts.symbols[3].value, "4");
    EXPECT_EQ(facts.symbols[5].name, "F");
    EXPECT_EQ(facts.symbols[6].name, "SRC_URI:append:mx8");
    EXPECT_EQ(facts.symbols[6].value, "file://fix.patch");
    EXPECT_EQ(facts.symbols[7].name, "PREFERRED_PROVIDER_virtual-kernel");
    EXPECT_EQ(facts.symbols[7].line, 8);
}

TEST_F(RecipeExtractorTest, RequireAndInclude) {
    auto facts = extract("require recipes-kernel/linux/linux-imx.inc\n"
                         "include \"conf/machine/include/imx-base.inc\"\n"
                         "  include    optional.inc  \n");
    ASSERT_EQ(facts.includes.size(), 3u);
    EXPECT_EQ(facts.includes[0].target, "recipes-kernel/linux/linux-imx.inc");
    EXPECT_EQ(facts.includes[0].kind, IncludeKind::Require);
    EXPECT_EQ(facts.includes[1].target, "conf/machine/include/imx-base.inc");
    EXPECT_EQ(facts.includes[1].kind, IncludeKind::Include);
    EXPECT_EQ(facts.includes[2].target, "optional.inc");
    EXPECT_EQ(facts.includes[2].line, 3);
}

TEST_F(RecipeExtractorTest, InheritYieldsOneEdgePerClass) {
    auto facts = extract("inherit core systemd\n");
    ASSERT_EQ(facts.includes.size(), 2u);
    EXPECT_EQ(facts.includes[0].target, "classes/core.bbclass");
    EXPECT_EQ(facts.includes[0].kind, IncludeKind::Inherit);
    EXPECT_EQ(facts.includes[1].target, "classes/systemd.bbclass");
    EXPECT_EQ(facts.includes[1].kind, IncludeKind::Inherit);
    EXPECT_TRUE(facts.symbols.empty());
}

TEST_F(RecipeExtractorTest, CommentsAndUnrelatedLinesIgnored) {
    auto facts = extract("# FOO = \"bar\"\n"
                         "\n"
                         "do_install() {\n"
                         "    install -d ${D}${bindir}\n"
                         "}\n");
    EXPECT_TRUE(facts.symbols.empty());
    EXPECT_TRUE(facts.includes.empty());
}

TEST_F(RecipeExtractorTest, ValueTruncatedToLimit) {
    std::string longValue(300, 'x');
    auto facts = extract("LONG = \"" + longValue + "\"\n");
    ASSERT_EQ(facts.symbols.size(), 1u);
    EXPECT_EQ(facts.symbols[0].value.size(), 200u);

    auto small = extract("LONG = \"" + longValue + "\"\n", ExtractionLimits{16, 500});
    EXPECT_EQ(small.symbols[0].value, std::string(16, 'x'));
}

TEST_F(RecipeExtractorTest, CrLfLineEndings) {
    auto facts = extract("MACHINE = \"imx8mpevk\"\r\nrequire a.inc\r\n");
    ASSERT_EQ(facts.symbols.size(), 1u);
    EXPECT_EQ(facts.symbols[0].value, "imx8mpevk");
    ASSERT_EQ(facts.includes.size(), 1u);
    EXPECT_EQ(facts.includes[0].target, "a.inc");
}

TEST_F(RecipeExtractorTest, HugeValueIsBounded) {
    auto facts = extract("SRC_URI = \"" + std::string(70000, 'u') + "\"\ninherit native\n");
    ASSERT_EQ(facts.symbols.size(), 1u);
    EXPECT_EQ(facts.symbols[0].value.size(), 200u);
    ASSERT_EQ(facts.includes.size(), 1u);
    EXPECT_EQ(facts.includes[0].target, "classes/native.bbclass");
}

#include <gtest/gtest.h>
#include <bspidx/extraction/header_extractor.h>

#include <string>

using namespace bspidx::extraction;

TEST(HeaderExtractorTest, DefinesAndIncludes) {
    HeaderExtractor extractor;
    auto facts = extractor.extract("#ifndef BOARD_H\n"
                                   "#define BOARD_H\n"
                                   "#include <linux/types.h>\n"
                                   "#include \"board-gpio.h\"\n"
                                   "#  define UART_BASE 0x30860000\n"
                                   "int not_a_define = 1;\n",
                                   {});

    ASSERT_EQ(facts.symbols.size(), 2u);
    EXPECT_EQ(facts.symbols[0].name, "BOARD_H");
    EXPECT_EQ(facts.symbols[0].value, "");
    EXPECT_EQ(facts.symbols[0].kind, SymbolKind::Define);
    EXPECT_EQ(facts.symbols[0].line, 2);
    EXPECT_EQ(facts.symbols[1].name, "UART_BASE");
    EXPECT_EQ(facts.symbols[1].value, "0x30860000");
    EXPECT_EQ(facts.symbols[1].line, 5);

    ASSERT_EQ(facts.includes.size(), 2u);
    EXPECT_EQ(facts.includes[0].target, "linux/types.h");
    EXPECT_EQ(facts.includes[0].kind, IncludeKind::PreprocessorInclude);
    EXPECT_EQ(facts.includes[1].target, "board-gpio.h");
    EXPECT_EQ(facts.includes[1].line, 4);
}

TEST(HeaderExtractorTest, ContinuedDefineIsJoined) {
    HeaderExtractor extractor;
    auto facts = extractor.extract("#define PINMUX(a, b) \\\n"
                                   "    ((a) << 8 | \\\n"
                                   "     (b))\n"
                                   "#define NEXT 1\n",
                                   {});

    ASSERT_EQ(facts.symbols.size(), 2u);
    EXPECT_EQ(facts.symbols[0].name, "PINMUX");
    EXPECT_EQ(facts.symbols[0].value, "(a, b) ((a) << 8 | (b))");
    EXPECT_EQ(facts.symbols[0].line, 1);
    EXPECT_EQ(facts.symbols[1].name, "NEXT");
    EXPECT_EQ(facts.symbols[1].line, 4);
}

TEST(HeaderExtractorTest, DefineOpenAtEndOfFileIsKept) {
    HeaderExtractor extractor;
    auto facts = extractor.extract("#define TAIL 1 \\", {});
    ASSERT_EQ(facts.symbols.size(), 1u);
    EXPECT_EQ(facts.symbols[0].value, "1");
}

TEST(HeaderExtractorTest, LongValueTruncated) {
    HeaderExtractor extractor;
    auto facts = extractor.extract("#define BIG " + std::string(250, '9') + "\n", {});
    ASSERT_EQ(facts.symbols.size(), 1u);
    EXPECT_EQ(facts.symbols[0].value.size(), 200u);
}

TEST(HeaderExtractorTest, HugeDefinesAreBounded) {
    HeaderExtractor extractor;
    std::string source = "#define BLOB " + std::string(70000, 'A') + "\n";
    source += "#define TABLE \\\n";
    for (int i = 0; i < 4000; ++i)
        source += "    0x00000001, 0x00000002, \\\n";
    source += "    0x0\n#define AFTER 1\n";

    auto facts = extractor.extract(source, {});

    ASSERT_EQ(facts.symbols.size(), 3u);
    EXPECT_EQ(facts.symbols[0].value.size(), 200u);
    EXPECT_EQ(facts.symbols[1].name, "TABLE");
    EXPECT_EQ(facts.symbols[1].value.size(), 200u);
    EXPECT_EQ(facts.symbols[2].name, "AFTER");
    EXPECT_EQ(facts.symbols[2].line, 4004);
}

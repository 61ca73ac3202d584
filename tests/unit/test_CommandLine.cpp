#include <gtest/gtest.h>
#include "util/commandLine.hpp"

using namespace ss::util;

class CommandLineTest : public ::testing::Test {};

TEST_F(CommandLineTest, PlainArgumentsStayBare) {
    EXPECT_EQ(quoteWindowsArgument("rose.pes"), "rose.pes");
    EXPECT_EQ(quoteWindowsArgument(R"(C:\plain\path\rose.pes)"), R"(C:\plain\path\rose.pes)");
    EXPECT_EQ(quoteWindowsArgument("--export-type=jef"), "--export-type=jef");
}

TEST_F(CommandLineTest, EmptyArgumentIsQuoted) {
    EXPECT_EQ(quoteWindowsArgument(""), R"("")");
}

TEST_F(CommandLineTest, SpacesAreQuotedWithBackslashesKept) {
    EXPECT_EQ(quoteWindowsArgument(R"(C:\Program Files\Inkscape\bin\inkscape.exe)"),
              R"("C:\Program Files\Inkscape\bin\inkscape.exe")");
    EXPECT_EQ(quoteWindowsArgument("a\tb"), "\"a\tb\"");
}

TEST_F(CommandLineTest, TrailingBackslashesAreDoubledBeforeClosingQuote) {
    EXPECT_EQ(quoteWindowsArgument(R"(C:\My Designs\)"), R"("C:\My Designs\\")");
    EXPECT_EQ(quoteWindowsArgument(R"(C:\My Designs\\)"), R"("C:\My Designs\\\\")");
}

TEST_F(CommandLineTest, EmbeddedQuotesAreEscaped) {
    EXPECT_EQ(quoteWindowsArgument(R"(say "hi")"), R"("say \"hi\"")");
    EXPECT_EQ(quoteWindowsArgument(R"(a\"b)"), R"("a\\\"b")");
}

TEST_F(CommandLineTest, CommandLineJoinsQuotedArguments) {
    EXPECT_EQ(buildWindowsCommandLine({"inkscape.exe", R"(C:\Users\me\Down loads\rose.pes)",
                                       R"(--export-filename=C:\out\rose.jef)"}),
              R"(inkscape.exe "C:\Users\me\Down loads\rose.pes" --export-filename=C:\out\rose.jef)");
    EXPECT_EQ(buildWindowsCommandLine({}), "");
    EXPECT_EQ(buildWindowsCommandLine({"tool", ""}), R"(tool "")");
}

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "cli/cli.hpp"
#include "sylva_test.hpp"

using namespace sylva;

namespace
{
    void parseCommandLine(argh::parser &cmdl, std::vector<const char *> args)
    {
        parseArguments(cmdl, static_cast<int>(args.size()), args.data());
    }
} // namespace

TEST(CliTest, DefaultOptions)
{
    argh::parser cmdl;
    parseCommandLine(cmdl, {"sylva", "tree"});

    SylvaOptions opts = collectOptions(cmdl);

    ASSERT_EQ(opts.getStyle(), NodeStyle::Tree);
    ASSERT_FALSE(opts.getInputFile().has_value());
}

TEST(CliTest, StyleForms)
{
    {
        argh::parser cmdl;
        parseCommandLine(cmdl, {"sylva", "tree", "--style=indent"});
        ASSERT_EQ(collectOptions(cmdl).getStyle(), NodeStyle::Indent);
    }
    {
        argh::parser cmdl;
        parseCommandLine(cmdl, {"sylva", "outline", "-s", "bullet"});
        SylvaOptions opts = collectOptions(cmdl);
        ASSERT_EQ(opts.getStyle(), NodeStyle::Bullet);
        ASSERT_FALSE(opts.getInputFile().has_value());
    }
    {
        argh::parser cmdl;
        parseCommandLine(cmdl, {"sylva", "tree", "--style", "tree", "scene.json"});
        SylvaOptions opts = collectOptions(cmdl);
        ASSERT_EQ(opts.getStyle(), NodeStyle::Tree);
        ASSERT_EQ(opts.getInputFile(), "scene.json");
    }
}

TEST(CliTest, TreeCommandReadsDocument)
{
    const std::string path = testDataPath("scene.json");
    argh::parser cmdl;
    parseCommandLine(cmdl, {"sylva", "tree", path.c_str(), "--style=bullet"});

    ::testing::internal::CaptureStdout();
    treeCommand(cmdl);
    std::string output = ::testing::internal::GetCapturedStdout();

    ASSERT_EQ(output,
              "* Scene\n"
              "  * Robot\n"
              "    * Flange\n"
              "      * Gripper\n"
              "        * Object\n"
              "    * Camera\n"
              "  * Table\n"
              "    * Box\n");
}

TEST(CliTest, ExpressionCommandsUseSample)
{
    argh::parser cmdl;
    parseCommandLine(cmdl, {"sylva", "eval"});

    ::testing::internal::CaptureStdout();
    evalCommand(cmdl);
    exprCommand(cmdl);
    versionCommand();
    std::string output = ::testing::internal::GetCapturedStdout();

    ASSERT_EQ(output, "0.5\n2 + ((5.0 * -3) / 10.0)\nSylva v1.0.0\n");
}

TEST(CliTest, InputFileMustBeJson)
{
    argh::parser cmdl;
    parseCommandLine(cmdl, {"sylva", "tree", "scene.txt"});

    ASSERT_THROW(treeCommand(cmdl), std::runtime_error);
}

TEST(CliDeathTest, UnknownStyle)
{
    argh::parser cmdl;
    parseCommandLine(cmdl, {"sylva", "tree", "--style=fancy"});

    EXPECT_EXIT(collectOptions(cmdl), ::testing::ExitedWithCode(1), "Unknown style 'fancy'");
}

TEST(CliDeathTest, UnknownFlag)
{
    argh::parser cmdl;
    parseCommandLine(cmdl, {"sylva", "tree", "--foo"});

    EXPECT_EXIT(collectOptions(cmdl), ::testing::ExitedWithCode(1), "Unknown option '--foo'");
}

TEST(CliDeathTest, TooManyArguments)
{
    argh::parser cmdl;
    parseCommandLine(cmdl, {"sylva", "tree", "a.json", "b.json"});

    EXPECT_EXIT(collectOptions(cmdl), ::testing::ExitedWithCode(1), "Incorrect number of arguments");
}

TEST(CliDeathTest, HelpExitsCleanly)
{
    argh::parser cmdl;
    parseCommandLine(cmdl, {"sylva", "tree", "--help"});

    EXPECT_EXIT(collectOptions(cmdl), ::testing::ExitedWithCode(0), "");
}

TEST(CliDeathTest, ParseErrorShowsPanel)
{
    const std::string path = testDataPath("broken.json");
    argh::parser cmdl;
    parseCommandLine(cmdl, {"sylva", "tree", path.c_str()});

    EXPECT_EXIT(treeCommand(cmdl), ::testing::ExitedWithCode(1), "broken\\.json:2 :: ");
}

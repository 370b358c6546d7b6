#include <gtest/gtest.h>

#include "app/CommandLineArgs.hpp"

#include <initializer_list>
#include <string_view>

namespace {

CommandLineArgs Parse(std::initializer_list<std::string_view> argv)
{
    return ParseCommandLineArgs(std::vector<std::string_view>(argv));
}

} // namespace

TEST(commandLineArgsTest, Defaults)
{
    const auto args = Parse({ "stara_maze" });

    EXPECT_TRUE(args.ok());
    EXPECT_FALSE(args.showHelp);
    EXPECT_FALSE(args.drawSolution);
    EXPECT_EQ(args.size, 40);
    EXPECT_EQ(args.seed, 42);
    EXPECT_EQ(args.start, (Position{ 1, 1 }));
    EXPECT_FALSE(args.goal.has_value());
    EXPECT_EQ(args.minValidPaths, 3);
    EXPECT_FALSE(args.output.has_value());
    EXPECT_EQ(ResolveGoal(args), (Position{ 38, 38 }));
}

TEST(commandLineArgsTest, ParsesEveryOption)
{
    const auto args = Parse({
        "stara_maze",
        "--size", "20",
        "--seed=-7",
        "--start", "2", "3",
        "--goal=15,16",
        "--min-valid-paths", "2",
        "--max-attempts=4",
        "--output", "out.html",
        "--draw-solution",
        "-v",
    });

    ASSERT_TRUE(args.ok());
    EXPECT_EQ(args.size, 20);
    EXPECT_EQ(args.seed, -7);
    EXPECT_EQ(args.start, (Position{ 2, 3 }));
    ASSERT_TRUE(args.goal.has_value());
    EXPECT_EQ(*args.goal, (Position{ 15, 16 }));
    EXPECT_EQ(args.minValidPaths, 2);
    EXPECT_EQ(args.maxAttempts, 4);
    ASSERT_TRUE(args.output.has_value());
    EXPECT_EQ(args.output->string(), "out.html");
    EXPECT_TRUE(args.drawSolution);
    EXPECT_TRUE(args.verbose);
    EXPECT_EQ(ResolveGoal(args), (Position{ 15, 16 }));
}

TEST(commandLineArgsTest, GoalDefaultsFromSize)
{
    const auto args = Parse({ "stara_maze", "--size", "10" });
    EXPECT_EQ(ResolveGoal(args), (Position{ 8, 8 }));
}

TEST(commandLineArgsTest, Help)
{
    EXPECT_TRUE(Parse({ "stara_maze", "--help" }).showHelp);
    EXPECT_TRUE(Parse({ "stara_maze", "-h" }).showHelp);
    EXPECT_NE(BuildCommandLineHelpText().find("--min-valid-paths"), std::string::npos);
}

TEST(commandLineArgsTest, UnknownOptionsAreCollected)
{
    const auto args = Parse({ "stara_maze", "--colour", "--size", "12", "extra" });
    EXPECT_FALSE(args.ok());
    ASSERT_EQ(args.unknown.size(), 2u);
    EXPECT_EQ(args.unknown[0], "--colour");
    EXPECT_EQ(args.unknown[1], "extra");
    EXPECT_EQ(args.size, 12);
}

TEST(commandLineArgsTest, BadValuesAreReported)
{
    const auto args = Parse({ "stara_maze", "--size", "big", "--start", "1", "x", "--seed" });
    EXPECT_FALSE(args.ok());
    EXPECT_EQ(args.errors.size(), 3u);
    EXPECT_EQ(args.size, 40);
    EXPECT_EQ(args.start, (Position{ 1, 1 }));
}

TEST(commandLineArgsTest, PairNeedsTwoValues)
{
    const auto args = Parse({ "stara_maze", "--goal", "3" });
    EXPECT_FALSE(args.ok());
    EXPECT_FALSE(args.goal.has_value());

    const auto inlineBad = Parse({ "stara_maze", "--goal=3" });
    EXPECT_FALSE(inlineBad.ok());
}

TEST(commandLineArgsTest, DefaultOutputName)
{
    EXPECT_EQ(DefaultOutputPath(40, 42, 3, PathAlgo::BFS).string(),
              "40x40_seed42_paths3_BFS_maze.html");
    EXPECT_EQ(DefaultOutputPath(8, -1, 1, PathAlgo::BFS).string(),
              "8x8_seed-1_paths1_BFS_maze.html");
}

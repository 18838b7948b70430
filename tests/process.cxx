#include <gtest/gtest.h>

#include "scratch.hxx"

#include <process.hxx>

TEST(ProcessTest, JoinSeparatesWithSpaces)
{
    EXPECT_EQ("git commit -m Default commit", process::Join({ "git", "commit", "-m", "Default commit" }));
    EXPECT_EQ("", process::Join({}));
}

#ifndef SYSTEM_WINDOWS

TEST(ProcessTest, CaptureCollectsBothStreamsAndExitCode)
{
    const auto result = process::Capture({ "sh", "-c", "echo out; echo err >&2; exit 3" }, {});

    EXPECT_EQ(3, result.ExitCode);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ("out\n", result.Out);
    EXPECT_EQ("err\n", result.Err);
}

TEST(ProcessTest, CaptureRunsInDirectory)
{
    ScratchDirectory scratch;

    const auto result = process::Capture({ "pwd", "-P" }, scratch.Path());

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(std::filesystem::canonical(scratch.Path()).string() + "\n", result.Out);
}

TEST(ProcessTest, CaptureHandlesLargeOutput)
{
    const auto result = process::Capture({ "sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; echo err$i >&2; i=$((i+1)); done" }, {});

    ASSERT_TRUE(result.ok());
    EXPECT_NE(std::string::npos, result.Out.find("line19999\n"));
    EXPECT_NE(std::string::npos, result.Err.find("err19999\n"));
}

TEST(ProcessTest, CaptureReportsCommandThatCannotStart)
{
    const auto result = process::Capture({ "gitex-no-such-command" }, {});

    EXPECT_EQ(127, result.ExitCode);
    EXPECT_NE(std::string::npos, result.Err.find("gitex-no-such-command"));
}

TEST(ProcessTest, ExecuteReturnsExitCode)
{
    EXPECT_EQ(0, process::Execute({ "true" }, {}));
    EXPECT_EQ(5, process::Execute({ "sh", "-c", "exit 5" }, {}));
    EXPECT_EQ(127, process::Execute({}, {}));
}

#endif

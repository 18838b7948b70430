#include <gtest/gtest.h>

#include "scratch.hxx"

#include <git.hxx>

#include <map>
#include <set>
#include <sstream>

class RecordingRunner
{
public:
    process::Result operator()(const std::vector<std::string> &command, const std::filesystem::path &directory)
    {
        const auto line = process::Join(command);

        Commands.push_back(line);
        Directories.push_back(directory);

        process::Result result;
        if (Failing.contains(line))
        {
            result.ExitCode = 1;
            result.Err = "conflict";
            return result;
        }

        if (const auto it = Outputs.find(line); it != Outputs.end())
            result.Out = it->second;
        return result;
    }

    std::vector<std::string> Commands;
    std::vector<std::filesystem::path> Directories;

    std::set<std::string> Failing;
    std::map<std::string, std::string> Outputs;
};

class GitTest : public ::testing::Test
{
protected:
    git::Client MakeClient()
    {
        return git::Client(
            [this](const std::vector<std::string> &command, const std::filesystem::path &directory)
            {
                return m_Runner(command, directory);
            },
            m_Out);
    }

    RecordingRunner m_Runner;
    std::ostringstream m_Out;
    std::filesystem::path m_Directory = "/work/repo";
};

TEST(GitFolderTest, FindsGitDirectoryInsidePath)
{
    ScratchDirectory scratch;
    std::filesystem::create_directories(scratch / ".git");

    const auto git_path = git::FindGitFolder(scratch.Path());
    ASSERT_TRUE(git_path.has_value());
    EXPECT_EQ(scratch / ".git", git_path.value());

    const auto context = git::FindContext(scratch.Path());
    ASSERT_TRUE(context.has_value());
    EXPECT_EQ(std::filesystem::absolute(scratch.Path()).lexically_normal(), context->Directory);
}

TEST(GitFolderTest, DoesNotSearchParentsOrAcceptFiles)
{
    ScratchDirectory scratch;
    std::filesystem::create_directories(scratch / ".git");
    std::filesystem::create_directories(scratch / "src");
    WriteFile(scratch / "src" / ".git", "gitdir: elsewhere");

    EXPECT_FALSE(git::FindGitFolder(scratch / "src").has_value());
    EXPECT_FALSE(git::FindGitFolder(scratch / "missing").has_value());
    EXPECT_FALSE(git::FindContext(scratch / "src").has_value());
}

TEST(GitSelectTest, PicksAbbreviatedHashesByIndex)
{
    const std::vector<std::string> list{ "a1b2c3 add readme", "d4e5f6 fix build", "0a0b0c initial commit" };

    std::vector<std::string> selected;
    ASSERT_EQ(0, git::SelectCommits(list, "2, 0", selected));
    EXPECT_EQ((std::vector<std::string>{ "0a0b0c", "a1b2c3" }), selected);
}

TEST(GitSelectTest, RejectsInvalidIndices)
{
    const std::vector<std::string> list{ "a1b2c3 add readme" };

    std::vector<std::string> selected;
    EXPECT_EQ(1, git::SelectCommits(list, "1", selected));
    EXPECT_EQ(1, git::SelectCommits(list, "x", selected));
    EXPECT_EQ(1, git::SelectCommits(list, "0,", selected));
    EXPECT_EQ(1, git::SelectCommits(list, "-1", selected));
    EXPECT_EQ(1, git::SelectCommits(list, "", selected));
}

TEST(GitOptionsTest, PushMessage)
{
    git::PushOptions defaults;
    ASSERT_EQ(0, git::ParsePushOptions({}, defaults));
    EXPECT_EQ("Default commit", defaults.Message);

    git::PushOptions options;
    ASSERT_EQ(0, git::ParsePushOptions({ "-m", "first", "--message", "fix typo" }, options));
    EXPECT_EQ("fix typo", options.Message);
}

TEST(GitOptionsTest, PushRejectsUnknownOrIncompleteOptions)
{
    testing::internal::CaptureStderr();

    git::PushOptions unknown;
    EXPECT_EQ(1, git::ParsePushOptions({ "--force" }, unknown));

    git::PushOptions missing;
    EXPECT_EQ(1, git::ParsePushOptions({ "-m" }, missing));

    testing::internal::GetCapturedStderr();
}

TEST(GitOptionsTest, CherryPickCollectsCommitsAndFlags)
{
    git::CherryPickOptions options;
    ASSERT_EQ(0, git::ParseCherryPickOptions(
        { "--cherry-pick", "1a2b3c4", "--branch", "main", "--cherry-pick", "5d6e7f8", "--auto-resolve" },
        options));

    EXPECT_EQ((std::vector<std::string>{ "1a2b3c4", "5d6e7f8" }), options.Commits);
    EXPECT_EQ("main", options.Branch);
    EXPECT_TRUE(options.AutoResolve);
    EXPECT_FALSE(options.Interactive);
}

TEST(GitOptionsTest, CherryPickInteractiveNeedsNoCommits)
{
    git::CherryPickOptions options;
    ASSERT_EQ(0, git::ParseCherryPickOptions({ "--interactive", "--branch", "release" }, options));

    EXPECT_TRUE(options.Interactive);
    EXPECT_TRUE(options.Commits.empty());
    EXPECT_EQ("release", options.Branch);
}

TEST(GitOptionsTest, CherryPickRejectsUnknownOrIncompleteOptions)
{
    testing::internal::CaptureStderr();

    git::CherryPickOptions unknown;
    EXPECT_EQ(1, git::ParseCherryPickOptions({ "--theirs" }, unknown));

    git::CherryPickOptions missing;
    EXPECT_EQ(1, git::ParseCherryPickOptions({ "--branch", "main", "--cherry-pick" }, missing));

    testing::internal::GetCapturedStderr();
}

TEST_F(GitTest, PushAddsCommitsAndPushesInOrder)
{
    auto client = MakeClient();

    EXPECT_EQ(0, client.Push(m_Directory, "update docs"));

    EXPECT_EQ((std::vector<std::string>{ "git add .", "git commit -m update docs", "git push" }), m_Runner.Commands);
    for (auto &directory : m_Runner.Directories)
        EXPECT_EQ(m_Directory, directory);

    EXPECT_NE(std::string::npos, m_Out.str().find("'git add .' executed successfully\n"));
}

TEST_F(GitTest, PushKeepsGoingAfterFailedStep)
{
    m_Runner.Failing.insert("git commit -m Default commit");
    auto client = MakeClient();

    EXPECT_EQ(1, client.Push(m_Directory, "Default commit"));

    EXPECT_EQ(3u, m_Runner.Commands.size());
    EXPECT_EQ("git push", m_Runner.Commands.back());
    EXPECT_NE(std::string::npos, m_Out.str().find("Error running 'git commit -m Default commit': conflict"));
}

TEST_F(GitTest, PullRunsGitPull)
{
    auto client = MakeClient();

    EXPECT_EQ(0, client.Pull(m_Directory));
    EXPECT_EQ((std::vector<std::string>{ "git pull" }), m_Runner.Commands);
}

TEST_F(GitTest, CommitListSplitsLogLines)
{
    m_Runner.Outputs["git log --oneline"] = "a1b2c3 second\r\nd4e5f6 first\n";
    auto client = MakeClient();

    EXPECT_EQ((std::vector<std::string>{ "a1b2c3 second", "d4e5f6 first" }), client.GetCommitList(m_Directory));
}

TEST_F(GitTest, CherryPickAppliesEveryCommit)
{
    auto client = MakeClient();

    EXPECT_EQ(0, client.CherryPick({ "a1b2c3", "d4e5f6" }, "main", m_Directory, false));

    EXPECT_EQ((std::vector<std::string>{ "git checkout main", "git cherry-pick a1b2c3", "git cherry-pick d4e5f6" }), m_Runner.Commands);
    EXPECT_NE(std::string::npos, m_Out.str().find("Cherry-picked commits ['a1b2c3', 'd4e5f6'] onto main successfully."));
}

TEST_F(GitTest, CherryPickAbortsOnConflict)
{
    m_Runner.Failing.insert("git cherry-pick a1b2c3");
    auto client = MakeClient();

    EXPECT_EQ(1, client.CherryPick({ "a1b2c3", "d4e5f6" }, "main", m_Directory, false));

    EXPECT_EQ((std::vector<std::string>{ "git checkout main", "git cherry-pick a1b2c3", "git cherry-pick --abort" }), m_Runner.Commands);
    EXPECT_NE(std::string::npos, m_Out.str().find("Conflict detected while cherry-picking commit a1b2c3. Aborting..."));
    EXPECT_EQ(std::string::npos, m_Out.str().find("successfully."));
}

TEST_F(GitTest, CherryPickSkipsConflictsWhenAutoResolving)
{
    m_Runner.Failing.insert("git cherry-pick a1b2c3");
    auto client = MakeClient();

    EXPECT_EQ(0, client.CherryPick({ "a1b2c3", "d4e5f6" }, "main", m_Directory, true));

    EXPECT_EQ(
        (std::vector<std::string>{
            "git checkout main",
            "git cherry-pick a1b2c3",
            "git cherry-pick --skip",
            "git cherry-pick d4e5f6",
        }),
        m_Runner.Commands);
    EXPECT_NE(std::string::npos, m_Out.str().find("Automatically skipped commit a1b2c3 due to conflicts."));
}

TEST_F(GitTest, CherryPickStopsWhenCheckoutFails)
{
    m_Runner.Failing.insert("git checkout release");
    auto client = MakeClient();

    EXPECT_EQ(1, client.CherryPick({ "a1b2c3" }, "release", m_Directory, false));
    EXPECT_EQ((std::vector<std::string>{ "git checkout release" }), m_Runner.Commands);
}

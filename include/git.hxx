#pragma once

#include <process.hxx>

#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace git
{
    using Runner = std::function<process::Result(const std::vector<std::string> &command, const std::filesystem::path &directory)>;

    struct Context
    {
        std::filesystem::path Path;
        std::filesystem::path GitPath;
        std::filesystem::path Directory;
    };

    /**
     * The .git directory directly inside `path`. Parent directories are not
     * searched.
     */
    std::optional<std::filesystem::path> FindGitFolder(const std::filesystem::path &path);
    std::optional<Context> FindContext(const std::filesystem::path &path);

    /**
     * Picks commits from `git log --oneline` lines by the comma separated
     * indices in `input`. Each selected line contributes its first word, the
     * abbreviated hash. Returns 0 on success, 1 on a malformed or out of
     * range index.
     */
    int SelectCommits(const std::vector<std::string> &list, std::string_view input, std::vector<std::string> &selected);

    struct PushOptions
    {
        std::string Message = "Default commit";
    };

    struct CherryPickOptions
    {
        std::vector<std::string> Commits;
        std::string Branch;
        bool AutoResolve{};
        bool Interactive{};
    };

    /**
     * Command line options of `gitex push` and `gitex cherry-pick`. An
     * unknown option, or one missing its value, prints an error and returns 1.
     */
    int ParsePushOptions(const std::vector<std::string_view> &args, PushOptions &options);
    int ParseCherryPickOptions(const std::vector<std::string_view> &args, CherryPickOptions &options);

    class Client
    {
    public:
        Client(Runner runner, std::ostream &out);

        /**
         * Runs the command and reports it on the output stream, including
         * its stdout on success and its stderr on failure.
         */
        bool Run(const std::vector<std::string> &command, const std::filesystem::path &directory, process::Result &result);
        bool Run(const std::vector<std::string> &command, const std::filesystem::path &directory);

        int Pull(const std::filesystem::path &directory);
        int Push(const std::filesystem::path &directory, const std::string &message);

        std::vector<std::string> GetCommitList(const std::filesystem::path &directory);

        int CherryPick(const std::vector<std::string> &commits, const std::string &branch, const std::filesystem::path &directory, bool auto_resolve);

    private:
        Runner m_Runner;
        std::ostream &m_Out;
    };
}

#include <git.hxx>
#include <util.hxx>

#include <charconv>
#include <iostream>

std::optional<std::filesystem::path> git::FindGitFolder(const std::filesystem::path &path)
{
    std::error_code error;
    if (!std::filesystem::is_directory(path, error))
        return std::nullopt;

    auto git_path = path / ".git";
    if (!std::filesystem::is_directory(git_path, error))
        return std::nullopt;

    return git_path;
}

std::optional<git::Context> git::FindContext(const std::filesystem::path &path)
{
    const auto absolute = std::filesystem::absolute(path).lexically_normal();

    auto git_path = FindGitFolder(absolute);
    if (!git_path.has_value())
        return std::nullopt;

    return Context{ absolute, git_path.value(), git_path->parent_path() };
}

int git::SelectCommits(const std::vector<std::string> &list, std::string_view input, std::vector<std::string> &selected)
{
    selected.clear();

    for (auto &part : Split(input, ','))
    {
        const auto index_string = Trim(part);

        std::size_t index = 0;
        const auto beg = index_string.data();
        const auto end = beg + index_string.size();
        if (const auto [ptr, ec] = std::from_chars(beg, end, index); index_string.empty() || ec != std::errc() || ptr != end)
            return 1;

        if (index >= list.size())
            return 1;

        const auto words = SplitWords(list[index]);
        if (words.empty())
            return 1;

        selected.push_back(words.front());
    }

    return selected.empty() ? 1 : 0;
}

int git::ParsePushOptions(const std::vector<std::string_view> &args, PushOptions &options)
{
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if ((args[i] == "-m" || args[i] == "--message") && i + 1 < args.size())
        {
            options.Message = args[++i];
            continue;
        }

        std::cerr << "invalid push argument '" << args[i] << "'." << std::endl;
        return 1;
    }

    return 0;
}

int git::ParseCherryPickOptions(const std::vector<std::string_view> &args, CherryPickOptions &options)
{
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == "--auto-resolve")
        {
            options.AutoResolve = true;
            continue;
        }
        if (args[i] == "--interactive")
        {
            options.Interactive = true;
            continue;
        }
        if (args[i] == "--cherry-pick" && i + 1 < args.size())
        {
            options.Commits.emplace_back(args[++i]);
            continue;
        }
        if (args[i] == "--branch" && i + 1 < args.size())
        {
            options.Branch = args[++i];
            continue;
        }

        std::cerr << "invalid cherry-pick argument '" << args[i] << "'." << std::endl;
        return 1;
    }

    return 0;
}

git::Client::Client(Runner runner, std::ostream &out)
    : m_Runner(std::move(runner)),
      m_Out(out)
{
}

bool git::Client::Run(const std::vector<std::string> &command, const std::filesystem::path &directory, process::Result &result)
{
    result = m_Runner(command, directory);

    if (result.ok())
    {
        m_Out << "'" << process::Join(command) << "' executed successfully" << std::endl << result.Out << std::endl;
        return true;
    }

    m_Out << "Error running '" << process::Join(command) << "': " << result.Err << std::endl;
    return false;
}

bool git::Client::Run(const std::vector<std::string> &command, const std::filesystem::path &directory)
{
    process::Result result;
    return Run(command, directory, result);
}

int git::Client::Pull(const std::filesystem::path &directory)
{
    return Run({ "git", "pull" }, directory) ? 0 : 1;
}

int git::Client::Push(const std::filesystem::path &directory, const std::string &message)
{
    // every step runs, a failed commit may still leave earlier commits to push
    auto ok = Run({ "git", "add", "." }, directory);
    ok = Run({ "git", "commit", "-m", message }, directory) && ok;
    ok = Run({ "git", "push" }, directory) && ok;
    return ok ? 0 : 1;
}

std::vector<std::string> git::Client::GetCommitList(const std::filesystem::path &directory)
{
    process::Result result;
    if (!Run({ "git", "log", "--oneline" }, directory, result))
        return {};

    std::vector<std::string> commits;
    for (auto &line : Split(Trim(result.Out), '\n'))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty())
            commits.push_back(line);
    }
    return commits;
}

int git::Client::CherryPick(const std::vector<std::string> &commits, const std::string &branch, const std::filesystem::path &directory, const bool auto_resolve)
{
    if (!Run({ "git", "checkout", branch }, directory))
        return 1;

    for (auto &commit : commits)
    {
        if (Run({ "git", "cherry-pick", commit }, directory))
            continue;

        if (auto_resolve)
        {
            if (!Run({ "git", "cherry-pick", "--skip" }, directory))
                return 1;
            m_Out << "Automatically skipped commit " << commit << " due to conflicts." << std::endl;
            continue;
        }

        m_Out << "Conflict detected while cherry-picking commit " << commit << ". Aborting..." << std::endl;
        if (!Run({ "git", "cherry-pick", "--abort" }, directory))
            m_Out << "Cherry-pick could not be aborted, resolve the repository state manually." << std::endl;
        return 1;
    }

    m_Out << "Cherry-picked commits [";
    for (std::size_t i = 0; i < commits.size(); ++i)
    {
        if (i)
            m_Out << ", ";
        m_Out << "'" << commits[i] << "'";
    }
    m_Out << "] onto " << branch << " successfully." << std::endl;

    return 0;
}

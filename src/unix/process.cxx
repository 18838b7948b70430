#if defined(SYSTEM_LINUX) || defined(SYSTEM_DARWIN)

#include <process.hxx>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

static constexpr int EXIT_NOT_STARTED = 127;

static std::vector<char *> MakeArgv(std::vector<std::string> &command)
{
    std::vector<char *> argv;
    for (auto &arg : command)
        argv.push_back(arg.data());
    argv.push_back(nullptr);
    return argv;
}

[[noreturn]] static void ExecChild(std::vector<std::string> command, const std::filesystem::path &directory)
{
    if (!directory.empty() && chdir(directory.c_str()) != 0)
    {
        const auto message = "cannot change directory to " + directory.string() + ": " + std::strerror(errno) + "\n";
        (void) !write(STDERR_FILENO, message.data(), message.size());
        _exit(EXIT_NOT_STARTED);
    }

    auto argv = MakeArgv(command);
    execvp(argv[0], argv.data());

    const auto message = "cannot run " + command.front() + ": " + std::strerror(errno) + "\n";
    (void) !write(STDERR_FILENO, message.data(), message.size());
    _exit(EXIT_NOT_STARTED);
}

static int WaitChild(const pid_t pid)
{
    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
            return -1;
    }

    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

process::Result process::Capture(const std::vector<std::string> &command, const std::filesystem::path &directory)
{
    Result result;

    if (command.empty())
    {
        result.ExitCode = EXIT_NOT_STARTED;
        result.Err = "empty command";
        return result;
    }

    int out[2], err[2];
    if (pipe(out) != 0)
    {
        result.ExitCode = EXIT_NOT_STARTED;
        result.Err = std::strerror(errno);
        return result;
    }
    if (pipe(err) != 0)
    {
        result.ExitCode = EXIT_NOT_STARTED;
        result.Err = std::strerror(errno);
        close(out[0]);
        close(out[1]);
        return result;
    }

    const auto pid = fork();
    if (pid < 0)
    {
        result.ExitCode = EXIT_NOT_STARTED;
        result.Err = std::strerror(errno);
        close(out[0]);
        close(out[1]);
        close(err[0]);
        close(err[1]);
        return result;
    }

    if (pid == 0)
    {
        dup2(out[1], STDOUT_FILENO);
        dup2(err[1], STDERR_FILENO);
        close(out[0]);
        close(out[1]);
        close(err[0]);
        close(err[1]);
        ExecChild(command, directory);
    }

    close(out[1]);
    close(err[1]);

    pollfd fds[2] = {
        { out[0], POLLIN, 0 },
        { err[0], POLLIN, 0 },
    };
    std::string *sinks[2] = { &result.Out, &result.Err };

    char buf[0x1000];
    int open_count = 2;
    while (open_count > 0)
    {
        if (poll(fds, 2, -1) < 0)
        {
            if (errno == EINTR)
                continue;
            break;
        }

        for (int i = 0; i < 2; ++i)
        {
            if (fds[i].fd < 0 || !fds[i].revents)
                continue;

            const auto len = read(fds[i].fd, buf, sizeof(buf));
            if (len > 0)
            {
                sinks[i]->append(buf, static_cast<std::size_t>(len));
                continue;
            }
            if (len < 0 && errno == EINTR)
                continue;

            close(fds[i].fd);
            fds[i].fd = -1;
            --open_count;
        }
    }

    for (auto &fd : fds)
    {
        if (fd.fd >= 0)
            close(fd.fd);
    }

    result.ExitCode = WaitChild(pid);
    return result;
}

int process::Execute(const std::vector<std::string> &command, const std::filesystem::path &directory)
{
    if (command.empty())
        return EXIT_NOT_STARTED;

    const auto pid = fork();
    if (pid < 0)
        return EXIT_NOT_STARTED;

    if (pid == 0)
        ExecChild(command, directory);

    return WaitChild(pid);
}

#endif

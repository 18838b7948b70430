#ifdef SYSTEM_WINDOWS

#include <process.hxx>
#include <util.hxx>

#include <functional>
#include <iostream>
#include <thread>

#include <windows.h>

static constexpr int EXIT_NOT_STARTED = 127;

std::wstring process::QuoteArgument(const std::wstring &argument)
{
    if (!argument.empty() && argument.find_first_of(L" \t\n\v\"") == std::wstring::npos)
        return argument;

    std::wstring quoted = L"\"";
    for (auto it = argument.begin();; ++it)
    {
        std::size_t backslashes = 0;
        while (it != argument.end() && *it == L'\\')
        {
            ++it;
            ++backslashes;
        }

        if (it == argument.end())
        {
            quoted.append(backslashes * 2, L'\\');
            break;
        }

        if (*it == L'"')
        {
            quoted.append(backslashes * 2 + 1, L'\\');
            quoted += *it;
        }
        else
        {
            quoted.append(backslashes, L'\\');
            quoted += *it;
        }
    }
    quoted += L'"';

    return quoted;
}

std::wstring process::BuildCommandLine(const std::vector<std::string> &command)
{
    std::wstring line;
    for (auto &arg : command)
    {
        if (!line.empty())
            line += L' ';
        line += QuoteArgument(std::filesystem::path(arg).wstring());
    }
    return line;
}

static void ReadAll(HANDLE pipe, std::string &sink)
{
    char buf[0x1000];
    DWORD len;
    while (ReadFile(pipe, buf, sizeof(buf), &len, nullptr) && len > 0)
        sink.append(buf, len);
}

static int Spawn(const std::vector<std::string> &command, const std::filesystem::path &directory, STARTUPINFOW &startup, PROCESS_INFORMATION &info, const BOOL inherit, std::string &error)
{
    auto line = process::BuildCommandLine(command);
    const auto cwd = directory.empty() ? std::wstring() : std::filesystem::absolute(directory).wstring();

    if (!CreateProcessW(
            nullptr,
            line.data(),
            nullptr,
            nullptr,
            inherit,
            0,
            nullptr,
            cwd.empty() ? nullptr : cwd.c_str(),
            &startup,
            &info))
    {
        error = "cannot run " + command.front() + ": " + GetErrorMessage(GetLastError());
        return 1;
    }

    return 0;
}

static int WaitChild(const PROCESS_INFORMATION &info)
{
    WaitForSingleObject(info.hProcess, INFINITE);

    DWORD code = 0;
    GetExitCodeProcess(info.hProcess, &code);

    CloseHandle(info.hThread);
    CloseHandle(info.hProcess);

    return static_cast<int>(code);
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

    SECURITY_ATTRIBUTES attributes{ sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE };

    HANDLE out_read, out_write, err_read, err_write;
    if (!CreatePipe(&out_read, &out_write, &attributes, 0))
    {
        result.ExitCode = EXIT_NOT_STARTED;
        result.Err = GetErrorMessage(GetLastError());
        return result;
    }
    if (!CreatePipe(&err_read, &err_write, &attributes, 0))
    {
        result.ExitCode = EXIT_NOT_STARTED;
        result.Err = GetErrorMessage(GetLastError());
        CloseHandle(out_read);
        CloseHandle(out_write);
        return result;
    }

    SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOW startup{};
    startup.cb = sizeof(startup);
    startup.dwFlags = STARTF_USESTDHANDLES;
    startup.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    startup.hStdOutput = out_write;
    startup.hStdError = err_write;

    PROCESS_INFORMATION info{};
    const auto error = Spawn(command, directory, startup, info, TRUE, result.Err);

    CloseHandle(out_write);
    CloseHandle(err_write);

    if (error)
    {
        CloseHandle(out_read);
        CloseHandle(err_read);
        result.ExitCode = EXIT_NOT_STARTED;
        return result;
    }

    std::thread err_reader(ReadAll, err_read, std::ref(result.Err));
    ReadAll(out_read, result.Out);
    err_reader.join();

    CloseHandle(out_read);
    CloseHandle(err_read);

    result.ExitCode = WaitChild(info);
    return result;
}

int process::Execute(const std::vector<std::string> &command, const std::filesystem::path &directory)
{
    if (command.empty())
        return EXIT_NOT_STARTED;

    STARTUPINFOW startup{};
    startup.cb = sizeof(startup);

    PROCESS_INFORMATION info{};
    std::string error;
    if (Spawn(command, directory, startup, info, FALSE, error))
    {
        std::cerr << error << std::endl;
        return EXIT_NOT_STARTED;
    }

    return WaitChild(info);
}

#endif

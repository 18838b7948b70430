#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace process
{
    struct Result
    {
        [[nodiscard]] bool ok() const { return ExitCode == 0; }

        int ExitCode{};
        std::string Out;
        std::string Err;
    };

    /**
     * Runs the command in the directory and collects its standard output and
     * error. A command that cannot be started reports exit code 127 and the
     * reason in Err.
     */
    Result Capture(const std::vector<std::string> &command, const std::filesystem::path &directory);

    /**
     * Runs the command in the directory with the standard streams of the
     * current process and returns its exit code.
     */
    int Execute(const std::vector<std::string> &command, const std::filesystem::path &directory);

    std::string Join(const std::vector<std::string> &command);

#ifdef SYSTEM_WINDOWS
    std::wstring QuoteArgument(const std::wstring &argument);
    std::wstring BuildCommandLine(const std::vector<std::string> &command);
#endif
}

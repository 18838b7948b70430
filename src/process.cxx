#include <process.hxx>

std::string process::Join(const std::vector<std::string> &command)
{
    std::string result;
    for (auto &arg : command)
    {
        if (!result.empty())
            result += ' ';
        result += arg;
    }
    return result;
}

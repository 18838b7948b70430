#ifdef SYSTEM_LINUX

#include <util.hxx>

#include <cstdlib>

#include <pwd.h>
#include <unistd.h>

std::filesystem::path GetHomeDirectory()
{
    static std::pair<bool, std::filesystem::path> directory{ false, {} };

    if (directory.first)
        return directory.second;

    std::filesystem::path path;
    if (const auto home = std::getenv("HOME"); home && *home)
    {
        path = home;
    }
    else if (const auto entry = getpwuid(getuid()); entry && entry->pw_dir)
    {
        path = entry->pw_dir;
    }
    else
    {
        path = std::filesystem::current_path();
    }

    directory = { true, path };

    return directory.second;
}

std::filesystem::path GetExecutablePath()
{
    std::error_code error;
    auto path = std::filesystem::read_symlink("/proc/self/exe", error);
    if (error)
        return {};
    return path;
}

#endif

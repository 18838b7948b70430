#ifdef SYSTEM_DARWIN

#include <util.hxx>

#include <cstdint>
#include <cstdlib>
#include <vector>

#include <mach-o/dyld.h>
#include <pwd.h>
#include <unistd.h>

std::filesystem::path GetHomeDirectory()
{
    static std::pair<bool, std::filesystem::path> directory{ false, {} };

    if (directory.first)
    {
        return directory.second;
    }

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
    std::uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);

    std::vector<char> buffer(size + 1);
    if (_NSGetExecutablePath(buffer.data(), &size) != 0)
    {
        return {};
    }

    std::error_code error;
    auto path = std::filesystem::canonical(buffer.data(), error);
    if (error)
    {
        return buffer.data();
    }

    return path;
}

#endif

#if defined(SYSTEM_LINUX) || defined(SYSTEM_DARWIN)

#include <pathlist.hxx>
#include <util.hxx>

#include <cstdlib>
#include <iostream>

int AppendSystemPath(const std::filesystem::path &directory, bool &appended)
{
    appended = false;

    const auto absolute = std::filesystem::absolute(directory).lexically_normal().string();

    std::string_view path;
    if (const auto value = std::getenv("PATH"))
        path = value;

    if (pathlist::Contains<char>(path, absolute, PATH_DELIMITER, PATH_IGNORE_CASE))
    {
        std::cout << absolute << " is already on the PATH." << std::endl;
        return 0;
    }

    std::cerr << "please add the following line to your shell configuration:" << std::endl;
    std::cout << "export PATH=\"$PATH:" << absolute << "\"" << std::endl;
    return 0;
}

int RemoveSystemPath(const std::filesystem::path &directory)
{
    const auto absolute = std::filesystem::absolute(directory).lexically_normal().string();

    std::string_view path;
    if (const auto value = std::getenv("PATH"))
        path = value;

    if (pathlist::Contains<char>(path, absolute, PATH_DELIMITER, PATH_IGNORE_CASE))
        std::cerr << "remove " << absolute << " from the PATH in your shell configuration if you added it there." << std::endl;

    return 0;
}

#endif

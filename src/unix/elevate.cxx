#if defined(SYSTEM_LINUX) || defined(SYSTEM_DARWIN)

#include <util.hxx>

#include <cerrno>
#include <cstring>
#include <iostream>

#include <unistd.h>

bool IsElevated()
{
    return geteuid() == 0;
}

bool IsWritable(const std::filesystem::path &directory)
{
    const auto directory_string = directory.string();
    return access(directory_string.c_str(), W_OK) == 0;
}

bool RequiresElevation(const std::filesystem::path &directory, bool)
{
    if (IsElevated())
        return false;

    // the directory may not exist yet; the machine PATH is never edited here
    return !IsWritable(GetExistingAncestor(directory));
}

int RelaunchElevated(const std::vector<std::string> &args)
{
    const auto self = GetExecutablePath().string();

    std::vector<std::string> command{ "sudo", self };
    command.insert(command.end(), args.begin(), args.end());

    std::vector<char *> argv;
    for (auto &arg : command)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    std::cout.flush();
    std::cerr.flush();

    execvp(argv[0], argv.data());

    std::cerr << "failed to run sudo: " << std::strerror(errno) << std::endl;
    return 1;
}

#endif

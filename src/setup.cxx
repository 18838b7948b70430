#include <assert.hxx>
#include <installer.hxx>

#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <version.h>

static void print()
{
    const auto defaults = install::DefaultOptions();

    std::cerr
            << PROJECT_NAME << "-setup - installer for " << PROJECT_NAME << "\n"
            << "\n"
            << "  Version:    " << PROJECT_VERSION << "\n"
            << "  Build date: " << PROJECT_BUILD_DATE << "\n"
            << "\n"
            << "Usage:\n"
            << "  gitex-setup [install] [options]\n"
            << "  gitex-setup uninstall [options]\n"
            << "\n"
            << "Commands:\n"
            << "  install,   i      Copy the binary and add its directory to the PATH (default)\n"
            << "  uninstall, u      Remove the binary and its PATH entry\n"
            << "  version,   v      Print the version\n"
            << "  help,      h      Print this help\n"
            << "\n"
            << "Options:\n"
            << "  --source <path>   Binary or release archive to install (" << defaults.Source.string() << ")\n"
            << "  --prefix <dir>    Destination directory (" << defaults.Directory.string() << ")\n"
            << "  --name <file>     Destination file name (" << defaults.Name << ")\n"
            << "  --entry <file>    File to take out of an archive source (same as --name)\n"
            << "  --no-path         Leave the PATH variable alone\n"
            << std::endl;
}

constexpr auto INSTALL_BITS = 0b0001u;
constexpr auto UNINSTALL_BITS = 0b0010u;
constexpr auto VERSION_BITS = 0b0100u;
constexpr auto HELP_BITS = 0b1000u;

static const std::map<std::string_view, unsigned> operation_map
{
    { "install", INSTALL_BITS },
    { "i", INSTALL_BITS },
    { "uninstall", UNINSTALL_BITS },
    { "u", UNINSTALL_BITS },
    { "version", VERSION_BITS },
    { "v", VERSION_BITS },
    { "--version", VERSION_BITS },
    { "help", HELP_BITS },
    { "h", HELP_BITS },
    { "--help", HELP_BITS },
    { "-h", HELP_BITS },
};

static int execute(const std::vector<std::string_view> &args)
{
    auto operation = INSTALL_BITS;
    std::size_t begin = 0;

    if (!args.empty() && !args[0].starts_with("--"))
    {
        Assert(operation_map.contains(args[0]), "undefined operation '{}'.", args[0]);

        operation = operation_map.at(args[0]);
        begin = 1;
    }
    else if (!args.empty() && operation_map.contains(args[0]))
    {
        operation = operation_map.at(args[0]);
        begin = 1;
    }

    switch (operation)
    {
    case VERSION_BITS:
        std::cout << PROJECT_NAME << "-setup " << PROJECT_VERSION << std::endl;
        return 0;

    case HELP_BITS:
        print();
        return 0;

    default:
        break;
    }

    installer::Arguments arguments;
    if (const auto error = installer::Parse(args, begin, arguments))
    {
        print();
        return error;
    }

    const auto privileges = installer::SystemPrivileges();

    if (operation == UNINSTALL_BITS)
        return installer::Uninstall(arguments, privileges) ? 1 : 0;

    return installer::Install(arguments, privileges) ? 1 : 0;
}

int main(const int argc, const char *const *argv)
{
    return execute({ argv + 1, argv + argc });
}

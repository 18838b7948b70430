#include <installer.hxx>
#include <util.hxx>

#include <iostream>

installer::Privileges installer::SystemPrivileges()
{
    return {
        [](const install::Options &options)
        {
            return RequiresElevation(options.Directory, options.UpdatePath);
        },
        RelaunchElevated,
    };
}

int installer::Parse(const std::vector<std::string_view> &args, const std::size_t begin, Arguments &arguments)
{
    for (auto i = begin; i < args.size(); ++i)
    {
        const auto arg = args[i];

        if (arg == "--no-path")
        {
            arguments.Options.UpdatePath = false;
            continue;
        }

        if (arg == ELEVATED_FLAG)
        {
            arguments.Elevated = true;
            continue;
        }

        if (arg != "--source" && arg != "--prefix" && arg != "--name" && arg != "--entry")
        {
            std::cerr << "undefined option '" << arg << "'." << std::endl;
            return 1;
        }

        if (i + 1 >= args.size())
        {
            std::cerr << "missing value for option '" << arg << "'." << std::endl;
            return 1;
        }

        const std::string value(args[++i]);

        if (arg == "--source")
            arguments.Options.Source = value;
        else if (arg == "--prefix")
            arguments.Options.Directory = value;
        else if (arg == "--name")
            arguments.Options.Name = value;
        else
            arguments.Options.Entry = value;
    }

    if (arguments.Options.Name.empty())
    {
        std::cerr << "the destination file name must not be empty." << std::endl;
        return 1;
    }

    return 0;
}

std::vector<std::string> installer::RelaunchArguments(std::string_view operation, const Arguments &arguments)
{
    auto &options = arguments.Options;

    std::vector<std::string> args{
        std::string(operation),
        "--source",
        std::filesystem::absolute(options.Source).string(),
        "--prefix",
        std::filesystem::absolute(options.Directory).string(),
        "--name",
        options.Name,
    };

    if (!options.Entry.empty())
    {
        args.emplace_back("--entry");
        args.push_back(options.Entry);
    }

    if (!options.UpdatePath)
        args.emplace_back("--no-path");

    args.emplace_back(ELEVATED_FLAG);
    return args;
}

static int Elevate(std::string_view operation, const installer::Arguments &arguments, const installer::Privileges &privileges)
{
    if (arguments.Elevated)
    {
        std::cerr << "still missing privileges after elevation." << std::endl;
        return 1;
    }

    std::cout << "Requesting elevated privileges..." << std::endl;

    if (const auto error = privileges.Relaunch(installer::RelaunchArguments(operation, arguments)))
    {
        std::cerr << "failed to acquire elevated privileges." << std::endl;
        return error;
    }

    return 0;
}

int installer::Install(const Arguments &arguments, const Privileges &privileges)
{
    // a missing source is reported before asking for any privileges
    if (const auto error = install::CheckSource(arguments.Options))
        return error;

    if (privileges.Requires(arguments.Options))
        return Elevate("install", arguments, privileges);

    install::Result result;
    return install::Install(arguments.Options, result);
}

int installer::Uninstall(const Arguments &arguments, const Privileges &privileges)
{
    if (privileges.Requires(arguments.Options))
        return Elevate("uninstall", arguments, privileges);

    return install::Uninstall(arguments.Options);
}

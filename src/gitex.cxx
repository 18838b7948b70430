#include <alias.hxx>
#include <assert.hxx>
#include <git.hxx>
#include <table.hxx>
#include <util.hxx>

#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <version.h>

static void print()
{
    std::cerr
            << PROJECT_NAME << " - " << PROJECT_TITLE << "\n"
            << "\n"
            << "  Version:    " << PROJECT_VERSION << "\n"
            << "  Build date: " << PROJECT_BUILD_DATE << "\n"
            << "\n"
            << "Usage:\n"
            << "  gitex [-p|--path <dir>] <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  pull                                  Pull latest changes\n"
            << "  push [-m|--message <text>]            Add edited files, commit with message and push\n"
            << "  cherry-pick --branch <branch>         Cherry-pick commits onto a branch\n"
            << "              [--cherry-pick <commit>]...\n"
            << "              [--auto-resolve]          Skip commits that conflict\n"
            << "              [--interactive]           Choose commits from the log\n"
            << "  alias-add <name> <command>            Add new alias\n"
            << "  alias-remove <name>                   Remove alias\n"
            << "  alias-list                            List all defined aliases\n"
            << "  alias-clear                           Clear all defined aliases\n"
            << "  run-alias <name> [args...]            Run a command using an alias\n"
            << "\n"
            << "Examples:\n"
            << "  gitex push -m \"fix typo\"\n"
            << "  gitex -p ../other cherry-pick --branch main --cherry-pick 1a2b3c4\n"
            << "  gitex alias-add st \"git status --short\"\n"
            << std::endl;
}

enum class Operation
{
    Pull,
    Push,
    CherryPick,
    AliasAdd,
    AliasRemove,
    AliasList,
    AliasClear,
    RunAlias,
    Version,
    Help,
};

static const std::map<std::string_view, Operation> operation_map
{
    { "pull", Operation::Pull },
    { "push", Operation::Push },
    { "cherry-pick", Operation::CherryPick },
    { "alias-add", Operation::AliasAdd },
    { "alias-remove", Operation::AliasRemove },
    { "alias-list", Operation::AliasList },
    { "alias-clear", Operation::AliasClear },
    { "run-alias", Operation::RunAlias },
    { "version", Operation::Version },
    { "--version", Operation::Version },
    { "help", Operation::Help },
    { "--help", Operation::Help },
};

static bool is_repository_operation(const Operation operation)
{
    return operation == Operation::Pull
           || operation == Operation::Push
           || operation == Operation::CherryPick;
}

static int cherry_pick(git::Client &client, const git::Context &context, const std::vector<std::string_view> &args)
{
    git::CherryPickOptions options;
    if (const auto error = git::ParseCherryPickOptions(args, options))
        return error;

    if (options.Interactive)
    {
        const auto list = client.GetCommitList(context.Directory);
        if (list.empty())
        {
            std::cerr << "no commits to choose from." << std::endl;
            return 1;
        }

        for (std::size_t i = 0; i < list.size(); ++i)
            std::cout << i << ": " << list[i] << std::endl;

        std::cout << "Enter the numbers of commits to cherry-pick, separated by commas: " << std::flush;

        std::string input;
        if (!std::getline(std::cin, input))
        {
            std::cerr << "no selection given." << std::endl;
            return 1;
        }

        if (git::SelectCommits(list, input, options.Commits))
        {
            std::cerr << "invalid selection '" << input << "'." << std::endl;
            return 1;
        }
    }

    if (options.Commits.empty() || options.Branch.empty())
    {
        std::cerr << "cherry-pick needs --branch and at least one commit." << std::endl;
        return 1;
    }

    return client.CherryPick(options.Commits, options.Branch, context.Directory, options.AutoResolve);
}

static int aliases(const Operation operation, const std::vector<std::string_view> &args)
{
    const auto path = alias::GetConfigPath();

    ini::Document config;
    if (const auto error = alias::Load(path, config))
        return error;

    switch (operation)
    {
    case Operation::AliasAdd:
    {
        Assert(args.size() == 2, "invalid argument count.");

        const std::string name(args[0]);
        const std::string command(args[1]);

        alias::Add(config, name, command);
        if (const auto error = alias::Save(path, config))
            return error;

        std::cout << "Alias '" << name << "' added for command '" << command << "'" << std::endl;
        return 0;
    }

    case Operation::AliasRemove:
    {
        Assert(args.size() == 1, "invalid argument count.");

        const std::string name(args[0]);
        if (!alias::Remove(config, name))
        {
            std::cout << "Alias '" << name << "' does not exist." << std::endl;
            return 0;
        }

        if (const auto error = alias::Save(path, config))
            return error;

        std::cout << "Alias '" << name << "' removed." << std::endl;
        return 0;
    }

    case Operation::AliasList:
    {
        Assert(args.empty(), "invalid argument count.");

        const auto entries = alias::List(config);
        if (entries.empty())
        {
            std::cout << "No aliases defined." << std::endl;
            return 0;
        }

        Table table({ { "Alias" }, { "Command" } });
        for (auto &[name, command] : entries)
            table.Row({ name, command });

        std::cout << table;
        return 0;
    }

    case Operation::AliasClear:
    {
        Assert(args.empty(), "invalid argument count.");

        alias::Clear(config);
        if (const auto error = alias::Save(path, config))
            return error;

        std::cout << "All aliases cleared." << std::endl;
        return 0;
    }

    case Operation::RunAlias:
    {
        Assert(!args.empty(), "invalid argument count.");

        const std::string name(args[0]);
        const std::vector<std::string> extra(args.begin() + 1, args.end());

        const auto command = alias::Resolve(config, name, extra);
        if (!command.has_value())
        {
            std::cout << "Alias '" << name << "' not found." << std::endl;
            return 1;
        }

        if (command->empty())
        {
            std::cerr << "alias '" << name << "' has no command." << std::endl;
            return 1;
        }

        return process::Execute(command.value(), std::filesystem::current_path());
    }

    default:
        return 1;
    }
}

static int execute(const std::vector<std::string_view> &args)
{
    std::string path = ".";

    std::size_t index = 0;
    while (index < args.size() && (args[index] == "-p" || args[index] == "--path"))
    {
        Assert(index + 1 < args.size(), "missing value for option '{}'.", args[index]);

        path = args[index + 1];
        index += 2;
    }

    if (index >= args.size())
    {
        print();
        return 0;
    }

    if (!operation_map.contains(args[index]))
    {
        std::cerr << "undefined operation '" << args[index] << "'." << std::endl;
        return 1;
    }

    const auto operation = operation_map.at(args[index]);
    const std::vector<std::string_view> rest(args.begin() + static_cast<std::ptrdiff_t>(index) + 1, args.end());

    switch (operation)
    {
    case Operation::Version:
        std::cout << PROJECT_NAME << " " << PROJECT_VERSION << std::endl;
        return 0;

    case Operation::Help:
        print();
        return 0;

    default:
        break;
    }

    if (!is_repository_operation(operation))
        return aliases(operation, rest);

    const auto context = git::FindContext(path);
    if (!context.has_value())
    {
        std::cout << std::filesystem::absolute(path).lexically_normal().string() << " is not a git project directory" << std::endl;
        return 0;
    }

    git::Client client(process::Capture, std::cout);

    switch (operation)
    {
    case Operation::Pull:
        Assert(rest.empty(), "invalid argument count.");
        return client.Pull(context->Directory);

    case Operation::Push:
    {
        git::PushOptions options;
        if (const auto error = git::ParsePushOptions(rest, options))
            return error;

        return client.Push(context->Directory, options.Message);
    }

    case Operation::CherryPick:
        return cherry_pick(client, context.value(), rest);

    default:
        return 1;
    }
}

int main(const int argc, const char *const *argv)
{
    return execute({ argv + 1, argv + argc });
}

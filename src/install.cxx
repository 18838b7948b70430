#include <digest.hxx>
#include <install.hxx>
#include <unpack.hxx>
#include <util.hxx>

#include <iostream>

install::Options install::DefaultOptions()
{
    Options options;
    options.Source = std::filesystem::path(".") / "dist" / "gitex.exe";

#if defined(SYSTEM_WINDOWS)
    options.Directory = "C:\\GitEx";
    options.Name = "gitex.exe";
#else
    options.Directory = "/usr/bin";
    options.Name = "gitex";
#endif

    return options;
}

int install::CheckSource(const Options &options)
{
    std::error_code error;
    if (std::filesystem::is_regular_file(options.Source, error))
        return 0;

    std::cerr
            << "Error: "
            << options.Source.filename().string()
            << " not found at "
            << options.Source.string()
            << "."
            << std::endl;
    return 1;
}

static int CopyBinary(const install::Options &options, const std::filesystem::path &destination, std::string &expected)
{
    if (IsArchive(options.Source))
    {
        const auto &entry = options.Entry.empty() ? options.Name : options.Entry;
        if (const auto error = ExtractEntry(options.Source, entry, destination))
        {
            std::cerr << "failed to extract '" << entry << "' from " << options.Source.string() << "." << std::endl;
            return error;
        }

        // nothing to compare an extracted entry against
        expected.clear();
        return 0;
    }

    if (const auto error = digest::Sha256File(options.Source, expected))
        return error;

    // installing the binary onto itself leaves nothing to copy
    std::error_code error;
    if (std::filesystem::equivalent(options.Source, destination, error))
        return 0;
    error.clear();

    std::filesystem::copy_file(options.Source, destination, std::filesystem::copy_options::overwrite_existing, error);
    if (error)
    {
        std::cerr << "failed to copy " << options.Source.string() << ": " << error.message() << std::endl;
        return error.value();
    }

    return 0;
}

int install::Install(const Options &options, Result &result)
{
    if (const auto error = CheckSource(options))
        return error;

    result = {};
    result.Destination = options.Directory / options.Name;

    std::cout << "Installing " << options.Source.string() << " to " << result.Destination.string() << "..." << std::endl;

    {
        std::error_code error;
        std::filesystem::create_directories(options.Directory, error);
        if (error)
        {
            std::cerr << "failed to create " << options.Directory.string() << ": " << error.message() << std::endl;
            return error.value();
        }
    }

    std::string previous;
    if (std::filesystem::exists(result.Destination))
    {
        if (const auto error = digest::Sha256File(result.Destination, previous))
            return error;
    }

    std::string expected;
    if (const auto error = CopyBinary(options, result.Destination, expected))
        return error;

    {
        std::error_code error;
        std::filesystem::permissions(
            result.Destination,
            std::filesystem::perms::owner_exec
            | std::filesystem::perms::group_exec
            | std::filesystem::perms::others_exec,
            std::filesystem::perm_options::add,
            error);
        if (error)
        {
            std::cerr << "failed to mark " << result.Destination.string() << " executable: " << error.message() << std::endl;
            return error.value();
        }
    }

    if (const auto error = digest::Sha256File(result.Destination, result.Digest))
        return error;

    if (!expected.empty() && expected != result.Digest)
    {
        std::cerr << "installed file " << result.Destination.string() << " does not match " << options.Source.string() << "." << std::endl;
        return 1;
    }

    result.Unchanged = !previous.empty() && previous == result.Digest;
    if (result.Unchanged)
        std::cout << result.Destination.string() << " was already up to date." << std::endl;

    if (options.UpdatePath)
    {
        if (const auto error = AppendSystemPath(options.Directory, result.PathAppended))
        {
            std::cerr << "failed to append " << options.Directory.string() << " to the system path." << std::endl;
            return error;
        }
    }

    std::cout << "Setup completed." << std::endl;
    return 0;
}

int install::Uninstall(const Options &options)
{
    const auto destination = options.Directory / options.Name;

    std::error_code error;
    const auto removed = std::filesystem::remove(destination, error);
    if (error)
    {
        std::cerr << "failed to remove " << destination.string() << ": " << error.message() << std::endl;
        return error.value();
    }

    if (removed)
        std::cout << "Removed " << destination.string() << "." << std::endl;
    else
        std::cerr << destination.string() << " is not installed." << std::endl;

    if (options.UpdatePath)
    {
        if (const auto code = RemoveSystemPath(options.Directory))
        {
            std::cerr << "failed to remove " << options.Directory.string() << " from the system path." << std::endl;
            return code;
        }
    }

    std::cout << "Uninstall completed." << std::endl;
    return 0;
}

#pragma once

#include <filesystem>
#include <string>

namespace install
{
    struct Options
    {
        std::filesystem::path Source;
        std::filesystem::path Directory;
        std::string Name;

        // file to take out of an archive source; empty means Name
        std::string Entry;

        bool UpdatePath = true;
    };

    struct Result
    {
        std::filesystem::path Destination;
        std::string Digest;

        bool Unchanged{};
        bool PathAppended{};
    };

    /**
     * ./dist/gitex.exe installed as C:\GitEx\gitex.exe on Windows and as
     * /usr/bin/gitex elsewhere.
     */
    Options DefaultOptions();

    /**
     * Prints the missing-source error and returns 1 if the source is not a
     * regular file.
     */
    int CheckSource(const Options &options);

    int Install(const Options &options, Result &result);
    int Uninstall(const Options &options);
}

#pragma once

#include <ini.hxx>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace alias
{
    constexpr auto SECTION = "aliases";

    /**
     * $GITEX_CONFIG if set, otherwise ~/.gitconfig
     */
    std::filesystem::path GetConfigPath();

    int Load(const std::filesystem::path &path, ini::Document &config);
    int Save(const std::filesystem::path &path, const ini::Document &config);

    void Add(ini::Document &config, const std::string &name, const std::string &command);
    bool Remove(ini::Document &config, const std::string &name);
    void Clear(ini::Document &config);

    ini::Entries List(const ini::Document &config);

    /**
     * The stored command split on whitespace with `args` appended, or
     * nothing if no alias has that name.
     */
    std::optional<std::vector<std::string>> Resolve(const ini::Document &config, const std::string &name, const std::vector<std::string> &args);
}

#include <alias.hxx>
#include <util.hxx>

#include <cstdlib>
#include <fstream>
#include <iostream>

std::filesystem::path alias::GetConfigPath()
{
    if (const auto path = std::getenv("GITEX_CONFIG"); path && *path)
        return path;

    return GetHomeDirectory() / ".gitconfig";
}

int alias::Load(const std::filesystem::path &path, ini::Document &config)
{
    if (!std::filesystem::exists(path))
    {
        config = {};
        return 0;
    }

    std::ifstream stream(path);
    if (!stream)
    {
        std::cerr << "failed to open " << path.string() << "." << std::endl;
        return 1;
    }

    config = ini::Document::Parse(stream);
    return 0;
}

int alias::Save(const std::filesystem::path &path, const ini::Document &config)
{
    std::ofstream stream(path, std::ios::trunc);
    if (!stream)
    {
        std::cerr << "failed to open " << path.string() << " for writing." << std::endl;
        return 1;
    }

    stream << config;

    if (!stream.flush())
    {
        std::cerr << "failed to write " << path.string() << "." << std::endl;
        return 1;
    }

    return 0;
}

void alias::Add(ini::Document &config, const std::string &name, const std::string &command)
{
    config.Set(SECTION, name, command);
}

bool alias::Remove(ini::Document &config, const std::string &name)
{
    return config.Remove(SECTION, name);
}

void alias::Clear(ini::Document &config)
{
    config.Clear(SECTION);
}

ini::Entries alias::List(const ini::Document &config)
{
    return config.GetEntries(SECTION);
}

std::optional<std::vector<std::string>> alias::Resolve(const ini::Document &config, const std::string &name, const std::vector<std::string> &args)
{
    const auto command = config.Get(SECTION, name);
    if (!command.has_value())
        return std::nullopt;

    auto words = SplitWords(command.value());
    words.insert(words.end(), args.begin(), args.end());
    return words;
}

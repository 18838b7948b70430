#include <ini.hxx>
#include <util.hxx>

#include <algorithm>
#include <sstream>
#include <utility>

ini::Line ini::ParseLine(const std::string &raw)
{
    Line line{ raw, {}, {} };

    const auto trimmed = Trim(raw);
    if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';')
        return line;

    const auto delim = trimmed.find('=');
    if (delim == std::string::npos)
    {
        // git allows a bare key as a shorthand for "key = true"
        line.Key = Lower(trimmed);
        return line;
    }

    line.Key = Lower(Trim(trimmed.substr(0, delim)));
    line.Value = Trim(trimmed.substr(delim + 1));
    return line;
}

// "[name]", optionally followed by a comment
static bool ParseHeader(const std::string &trimmed, std::string &name)
{
    if (trimmed.empty() || trimmed.front() != '[')
        return false;

    const auto close = trimmed.find(']');
    if (close == std::string::npos)
        return false;

    const auto rest = Trim(trimmed.substr(close + 1));
    if (!rest.empty() && rest.front() != '#' && rest.front() != ';')
        return false;

    name = Trim(trimmed.substr(1, close - 1));
    return true;
}

ini::Document ini::Document::Parse(std::istream &stream)
{
    Document document;
    document.m_Sections.push_back({});

    std::string raw;
    while (std::getline(stream, raw))
    {
        if (!raw.empty() && raw.back() == '\r')
            raw.pop_back();

        if (std::string name; ParseHeader(Trim(raw), name))
        {
            document.m_Sections.push_back({ std::move(name), raw, {} });
            continue;
        }

        document.m_Sections.back().Lines.push_back(ParseLine(raw));
    }

    return document;
}

ini::Document ini::Document::Parse(const std::string &string)
{
    std::istringstream stream(string);
    return Parse(stream);
}

ini::Section *ini::Document::Find(std::string_view name)
{
    // the first section is the unnamed preamble
    for (std::size_t i = 1; i < m_Sections.size(); ++i)
    {
        if (m_Sections[i].Name == name)
            return &m_Sections[i];
    }
    return nullptr;
}

const ini::Section *ini::Document::Find(std::string_view name) const
{
    for (std::size_t i = 1; i < m_Sections.size(); ++i)
    {
        if (m_Sections[i].Name == name)
            return &m_Sections[i];
    }
    return nullptr;
}

ini::Section &ini::Document::Require(std::string_view name)
{
    if (m_Sections.empty())
        m_Sections.push_back({});

    if (const auto section = Find(name))
        return *section;

    std::string header = "[";
    header += name;
    header += ']';

    m_Sections.push_back({ std::string(name), header, {} });
    return m_Sections.back();
}

ini::Entries ini::Document::GetEntries(std::string_view name) const
{
    Entries entries;

    const auto section = Find(name);
    if (!section)
        return entries;

    for (auto &line : section->Lines)
    {
        if (!line.IsEntry())
            continue;

        // a repeated key overrides the earlier one
        auto it = std::find_if(entries.begin(), entries.end(), [&line](auto &entry) { return entry.first == line.Key; });
        if (it != entries.end())
            it->second = line.Value;
        else
            entries.emplace_back(line.Key, line.Value);
    }

    return entries;
}

std::optional<std::string> ini::Document::Get(std::string_view section, std::string_view key) const
{
    const auto lower = Lower(std::string(key));

    std::optional<std::string> value;
    for (auto &[name, entry] : GetEntries(section))
    {
        if (name == lower)
            value = entry;
    }
    return value;
}

void ini::Document::Set(std::string_view section, std::string_view key, std::string_view value)
{
    auto &target = Require(section);

    const auto lower = Lower(std::string(key));
    const auto raw = '\t' + lower + " = " + std::string(value);

    Line *found = nullptr;
    for (auto &line : target.Lines)
    {
        if (line.Key == lower)
            found = &line;
    }

    if (found)
    {
        *found = ParseLine(raw);
        return;
    }

    // keep trailing blank lines after the new entry
    auto it = target.Lines.end();
    while (it != target.Lines.begin() && Trim((it - 1)->Raw).empty())
        --it;

    target.Lines.insert(it, ParseLine(raw));
}

bool ini::Document::Remove(std::string_view section, std::string_view key)
{
    const auto target = Find(section);
    if (!target)
        return false;

    const auto lower = Lower(std::string(key));

    const auto before = target->Lines.size();
    std::erase_if(target->Lines, [&lower](auto &line) { return line.Key == lower; });
    return target->Lines.size() != before;
}

void ini::Document::Clear(std::string_view section)
{
    auto &target = Require(section);
    std::erase_if(target.Lines, [](auto &line) { return line.IsEntry(); });
}

std::ostream &ini::Document::Print(std::ostream &stream) const
{
    for (auto &section : m_Sections)
    {
        if (!section.Header.empty())
            stream << section.Header << '\n';

        for (auto &line : section.Lines)
            stream << line.Raw << '\n';
    }
    return stream;
}

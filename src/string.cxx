#include <util.hxx>

#include <algorithm>
#include <cctype>

static bool IsSpace(const char c)
{
    return std::isspace(static_cast<unsigned char>(c));
}

std::string Trim(std::string string)
{
    const auto beg = std::find_if_not(string.begin(), string.end(), IsSpace);
    string.erase(string.begin(), beg);

    const auto end = std::find_if_not(string.rbegin(), string.rend(), IsSpace);
    string.erase(end.base(), string.end());

    return string;
}

std::string Lower(std::string string)
{
    for (auto &it : string)
        it = static_cast<char>(std::tolower(static_cast<unsigned char>(it)));
    return string;
}

std::vector<std::string> SplitWords(std::string_view string)
{
    std::vector<std::string> words;

    std::string word;
    for (auto c : string)
    {
        if (IsSpace(c))
        {
            if (!word.empty())
                words.emplace_back(std::move(word));
            word.clear();
            continue;
        }
        word += c;
    }

    if (!word.empty())
        words.emplace_back(std::move(word));

    return words;
}

std::vector<std::string> Split(std::string_view string, const char delimiter)
{
    std::vector<std::string> parts;

    std::size_t beg = 0, end;
    while ((end = string.find(delimiter, beg)) != std::string_view::npos)
    {
        parts.emplace_back(string.substr(beg, end - beg));
        beg = end + 1;
    }
    parts.emplace_back(string.substr(beg));

    return parts;
}

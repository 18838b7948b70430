#pragma once

#include <cctype>
#include <cwctype>
#include <string>
#include <string_view>
#include <vector>

/**
 * Helpers for PATH-like lists: a string of directories joined by a single
 * delimiter character (';' on Windows, ':' elsewhere).
 *
 * Segments are compared whole, never as substrings, so a directory is found
 * whether it is the first, a middle or the last segment. Trailing directory
 * separators are ignored ("C:\GitEx\" equals "C:\GitEx").
 */
namespace pathlist
{
    inline char FoldCase(const char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
    inline wchar_t FoldCase(const wchar_t c) { return static_cast<wchar_t>(std::towlower(c)); }

    template <typename C>
    std::basic_string_view<C> StripSeparators(std::basic_string_view<C> segment)
    {
        while (segment.size() > 1 && (segment.back() == C('/') || segment.back() == C('\\')))
            segment.remove_suffix(1);
        return segment;
    }

    template <typename C>
    bool SameSegment(std::basic_string_view<C> a, std::basic_string_view<C> b, const bool ignore_case)
    {
        a = StripSeparators(a);
        b = StripSeparators(b);

        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (ignore_case ? FoldCase(a[i]) != FoldCase(b[i]) : a[i] != b[i])
                return false;
        }

        return true;
    }

    template <typename C>
    std::vector<std::basic_string<C>> Split(std::basic_string_view<C> value, const C delimiter)
    {
        std::vector<std::basic_string<C>> segments;

        std::size_t beg = 0, end;
        while ((end = value.find(delimiter, beg)) != std::basic_string_view<C>::npos)
        {
            if (end != beg)
                segments.emplace_back(value.substr(beg, end - beg));
            beg = end + 1;
        }

        if (beg < value.size())
            segments.emplace_back(value.substr(beg));

        return segments;
    }

    template <typename C>
    bool Contains(std::basic_string_view<C> value, std::basic_string_view<C> folder, const C delimiter, const bool ignore_case)
    {
        for (auto &segment : Split(value, delimiter))
        {
            if (SameSegment<C>(segment, folder, ignore_case))
                return true;
        }
        return false;
    }

    template <typename C>
    std::basic_string<C> Append(std::basic_string<C> value, std::basic_string_view<C> folder, const C delimiter, const bool ignore_case)
    {
        if (folder.empty() || Contains<C>(value, folder, delimiter, ignore_case))
            return value;

        if (!value.empty() && value.back() != delimiter)
            value += delimiter;

        value += folder;
        return value;
    }

    template <typename C>
    std::basic_string<C> Remove(std::basic_string_view<C> value, std::basic_string_view<C> folder, const C delimiter, const bool ignore_case)
    {
        std::basic_string<C> result;

        for (auto &segment : Split(value, delimiter))
        {
            if (SameSegment<C>(segment, folder, ignore_case))
                continue;

            if (!result.empty())
                result += delimiter;
            result += segment;
        }

        return result;
    }
}

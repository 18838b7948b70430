#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * INI style configuration files such as ~/.gitconfig.
 *
 * The document keeps every line it read, so writing it back only changes
 * the entries that were edited. Keys are case-insensitive and stored lower
 * case; section names are compared as written.
 */
namespace ini
{
    struct Line
    {
        [[nodiscard]] bool IsEntry() const { return !Key.empty(); }

        std::string Raw;
        std::string Key;
        std::string Value;
    };

    struct Section
    {
        std::string Name;
        std::string Header;
        std::vector<Line> Lines;
    };

    using Entries = std::vector<std::pair<std::string, std::string>>;

    class Document
    {
    public:
        static Document Parse(std::istream &stream);
        static Document Parse(const std::string &string);

        [[nodiscard]] Entries GetEntries(std::string_view name) const;
        [[nodiscard]] std::optional<std::string> Get(std::string_view section, std::string_view key) const;

        void Set(std::string_view section, std::string_view key, std::string_view value);
        bool Remove(std::string_view section, std::string_view key);

        /**
         * Removes every entry of the section, creating it if it is missing.
         * Comments inside the section are kept.
         */
        void Clear(std::string_view section);

        std::ostream &Print(std::ostream &stream) const;

    private:
        Section *Find(std::string_view name);
        const Section *Find(std::string_view name) const;

        Section &Require(std::string_view name);

        std::vector<Section> m_Sections;
    };

    Line ParseLine(const std::string &raw);
}

inline std::ostream &operator<<(std::ostream &stream, const ini::Document &document)
{
    return document.Print(stream);
}

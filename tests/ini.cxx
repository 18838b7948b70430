#include <gtest/gtest.h>

#include <ini.hxx>

#include <sstream>

static std::string Print(const ini::Document &document)
{
    std::ostringstream stream;
    stream << document;
    return stream.str();
}

static const std::string GITCONFIG =
    "# user settings\n"
    "[user]\n"
    "\tname = Jane Doe\n"
    "\temail = jane@example.com\n"
    "[remote \"origin\"]\n"
    "\turl = git@example.com:jane/repo.git\n"
    "[aliases]\n"
    "\tst = git status\n"
    "\n"
    "[core]\n"
    "\teditor = vim\n";

TEST(IniTest, PrintsUnmodifiedDocumentVerbatim)
{
    const auto document = ini::Document::Parse(GITCONFIG);

    EXPECT_EQ(GITCONFIG, Print(document));
}

TEST(IniTest, ReadsEntriesOfQuotedAndPlainSections)
{
    const auto document = ini::Document::Parse(GITCONFIG);

    EXPECT_EQ("git@example.com:jane/repo.git", document.Get("remote \"origin\"", "url").value_or(""));
    EXPECT_EQ("Jane Doe", document.Get("user", "NAME").value_or(""));
    EXPECT_FALSE(document.Get("user", "signingkey").has_value());
    EXPECT_FALSE(document.Get("missing", "name").has_value());
}

TEST(IniTest, ParseLineSplitsOnFirstDelimiter)
{
    const auto line = ini::ParseLine("  Url = https://example.com:8080/x ");

    EXPECT_TRUE(line.IsEntry());
    EXPECT_EQ("url", line.Key);
    EXPECT_EQ("https://example.com:8080/x", line.Value);

    EXPECT_FALSE(ini::ParseLine("; comment").IsEntry());
    EXPECT_FALSE(ini::ParseLine("   ").IsEntry());
    EXPECT_EQ("bare", ini::ParseLine("\tBare").Key);
}

TEST(IniTest, SetAddsEntryBeforeTrailingBlankLines)
{
    auto document = ini::Document::Parse(GITCONFIG);
    document.Set("aliases", "lg", "git log --oneline");

    EXPECT_EQ(
        "# user settings\n"
        "[user]\n"
        "\tname = Jane Doe\n"
        "\temail = jane@example.com\n"
        "[remote \"origin\"]\n"
        "\turl = git@example.com:jane/repo.git\n"
        "[aliases]\n"
        "\tst = git status\n"
        "\tlg = git log --oneline\n"
        "\n"
        "[core]\n"
        "\teditor = vim\n",
        Print(document));
}

TEST(IniTest, SetReplacesExistingEntryInPlace)
{
    auto document = ini::Document::Parse("[aliases]\nST=git status\nco = git checkout\n");
    document.Set("aliases", "st", "git status --short");

    EXPECT_EQ("[aliases]\n\tst = git status --short\nco = git checkout\n", Print(document));
}

TEST(IniTest, SetCreatesMissingSection)
{
    auto document = ini::Document::Parse("[user]\n\tname = Jane\n");
    document.Set("aliases", "st", "git status");

    EXPECT_EQ("[user]\n\tname = Jane\n[aliases]\n\tst = git status\n", Print(document));
}

TEST(IniTest, SetOnEmptyDocument)
{
    ini::Document document;
    document.Set("aliases", "st", "git status");

    EXPECT_EQ("[aliases]\n\tst = git status\n", Print(document));
}

TEST(IniTest, RemoveReportsWhetherEntryExisted)
{
    auto document = ini::Document::Parse(GITCONFIG);

    EXPECT_TRUE(document.Remove("aliases", "ST"));
    EXPECT_FALSE(document.Remove("aliases", "st"));
    EXPECT_FALSE(document.Remove("missing", "st"));
    EXPECT_TRUE(document.GetEntries("aliases").empty());
}

TEST(IniTest, ClearKeepsCommentsAndOtherSections)
{
    auto document = ini::Document::Parse("[aliases]\n# mine\n\tst = git status\n\tco = git checkout\n[core]\n\teditor = vim\n");
    document.Clear("aliases");

    EXPECT_EQ("[aliases]\n# mine\n[core]\n\teditor = vim\n", Print(document));
}

TEST(IniTest, LaterDuplicateKeyWins)
{
    const auto document = ini::Document::Parse("[aliases]\nst = git status\nst = git status -sb\n");
    const auto entries = document.GetEntries("aliases");

    ASSERT_EQ(1u, entries.size());
    EXPECT_EQ("git status -sb", entries[0].second);
    EXPECT_EQ("git status -sb", document.Get("aliases", "st").value_or(""));
}

TEST(IniTest, CarriageReturnsAreDropped)
{
    const auto document = ini::Document::Parse("[aliases]\r\nst = git status\r\n");

    EXPECT_EQ("git status", document.Get("aliases", "st").value_or(""));
    EXPECT_EQ("[aliases]\nst = git status\n", Print(document));
}

TEST(IniTest, SectionHeaderMayCarryComment)
{
    auto document = ini::Document::Parse("[user]\n\tname = Jane\n[aliases] # mine\n\tst = git status\n[core] ; editor\n\teditor = vim\n");

    EXPECT_EQ("git status", document.Get("aliases", "st").value_or(""));
    EXPECT_FALSE(document.Get("user", "[aliases] # mine").has_value());
    EXPECT_EQ("vim", document.Get("core", "editor").value_or(""));

    document.Set("aliases", "co", "git checkout");

    EXPECT_EQ(
        "[user]\n\tname = Jane\n"
        "[aliases] # mine\n\tst = git status\n\tco = git checkout\n"
        "[core] ; editor\n\teditor = vim\n",
        Print(document));
}

TEST(IniTest, BracketedValueIsNotAHeader)
{
    const auto document = ini::Document::Parse("[aliases]\n[x] y = z\n");

    EXPECT_EQ("z", document.Get("aliases", "[x] y").value_or(""));
}

TEST(IniTest, ColonIsPartOfTheKey)
{
    const auto line = ini::ParseLine("\ta:b = git status");

    EXPECT_EQ("a:b", line.Key);
    EXPECT_EQ("git status", line.Value);
}

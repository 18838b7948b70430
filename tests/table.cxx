#include <gtest/gtest.h>

#include <table.hxx>

#include <sstream>

TEST(TableTest, PadsColumnsToTheWidestCell)
{
    Table table({ { "Alias" }, { "Command" } });
    table.Row({ "st", "git status" });
    table.Row({ "lg", "git log --oneline" });

    std::ostringstream stream;
    stream << table;

    EXPECT_EQ(
        "Alias  Command\n"
        "st     git status\n"
        "lg     git log --oneline\n",
        stream.str());
}

TEST(TableTest, RightAlignedColumns)
{
    Table table({ { "N", false }, { "V" } });
    table.Row({ "10", "a" });
    table.Row({ "7", "b" });

    std::ostringstream stream;
    stream << table;

    EXPECT_EQ(
        " N  V\n"
        "10  a\n"
        " 7  b\n",
        stream.str());
}

TEST(TableTest, MissingCellsAreBlank)
{
    Table table({ { "A" }, { "B" } });
    table.Row({ "only" });
    table.Row({ "x", "y" });

    std::ostringstream stream;
    stream << table;

    EXPECT_EQ(
        "A     B\n"
        "only\n"
        "x     y\n",
        stream.str());
}

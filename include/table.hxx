#pragma once

#include <ostream>
#include <string>
#include <vector>

class Table
{
public:
    struct Column
    {
        Column(std::string label, const bool left = true)
            : Label(std::move(label)),
              Left(left)
        {
        }

        std::string Label;
        bool Left;
    };

    explicit Table(std::vector<Column> columns);

    /**
     * Adds a row; missing cells are left blank, extra cells are dropped.
     */
    Table &Row(std::vector<std::string> cells);

    std::ostream &Print(std::ostream &stream) const;

private:
    std::ostream &PrintRow(std::ostream &stream, const std::vector<std::string> &cells) const;

    std::vector<Column> m_Columns;
    std::vector<std::size_t> m_Widths;
    std::vector<std::vector<std::string>> m_Rows;
};

inline std::ostream &operator<<(std::ostream &stream, const Table &table)
{
    return table.Print(stream);
}

#include <table.hxx>

#include <algorithm>

Table::Table(std::vector<Column> columns)
    : m_Columns(std::move(columns))
{
    for (auto &column : m_Columns)
        m_Widths.push_back(column.Label.length());
}

Table &Table::Row(std::vector<std::string> cells)
{
    cells.resize(m_Columns.size());

    for (std::size_t i = 0; i < cells.size(); ++i)
        m_Widths[i] = std::max(m_Widths[i], cells[i].length());

    m_Rows.push_back(std::move(cells));
    return *this;
}

std::ostream &Table::PrintRow(std::ostream &stream, const std::vector<std::string> &cells) const
{
    std::string line;
    for (std::size_t i = 0; i < m_Columns.size(); ++i)
    {
        if (i)
            line += "  ";

        const auto &cell = cells[i];
        const auto padding = std::string(m_Widths[i] - cell.length(), ' ');

        line += m_Columns[i].Left ? cell + padding : padding + cell;
    }

    // no trailing blanks after a left aligned last column
    line.erase(line.find_last_not_of(' ') + 1);

    return stream << line << std::endl;
}

std::ostream &Table::Print(std::ostream &stream) const
{
    std::vector<std::string> labels;
    for (auto &column : m_Columns)
        labels.push_back(column.Label);

    PrintRow(stream, labels);

    for (auto &row : m_Rows)
        PrintRow(stream, row);

    return stream;
}

#include "Table.hpp"
#include "Errors.hpp"

#include <gsl-lite/gsl-lite.hpp>

#include <algorithm>
#include <ostream>
#include <utility>

namespace echolab {

namespace {

void WriteField(std::ostream& os, std::string_view s) {
  const auto quote = s.find_first_of(",\"\r\n") != std::string_view::npos;
  if (!quote) {
    os << s;
    return;
  }
  os << '"';
  for (auto ch: s) {
    if (ch == '"')
      os << '"';
    os << ch;
  }
  os << '"';
} // WriteField

} // local

void Table::push(Row row) {
  gsl_Expects(row.size() == _columns.size());
  _rows.push_back(std::move(row));
} // Table::push

std::optional<std::size_t> Table::column(std::string_view name) const noexcept
{
  auto it = std::ranges::find_if(_columns,
                          [name](const Column& c) { return c.name == name; });
  if (it == _columns.end())
    return std::nullopt;
  return static_cast<std::size_t>(it - _columns.begin());
} // Table::column

const Cell& Table::at(std::size_t row, std::string_view name) const {
  const auto c = column(name);
  if (!c)
    throw LookupMiss{name};
  return _rows.at(row).at(*c);
} // Table::at

void WriteCsv(std::ostream& os, const Table& table) {
  auto sep = "";
  for (const auto& c: table.columns()) {
    os << sep;
    WriteField(os, c.name);
    sep = ",";
  }
  os << '\n';
  for (const auto& row: table.rows()) {
    sep = "";
    for (const auto& cell: row) {
      os << sep;
      WriteField(os, ToString(cell));
      sep = ",";
    }
    os << '\n';
  }
} // WriteCsv

} // echolab

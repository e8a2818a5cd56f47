#pragma once

#include "Codec.hpp"
#include "XmlMap.hpp"

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace echolab {

struct Column {
  std::string name;
  ColumnType type = ColumnType::String;
  bool operator==(const Column&) const = default;
}; // Column

/// Rows of named scalar cells, one column type per column.
class Table {
public:
  using Row = std::vector<Cell>;

private:
  std::vector<Column> _columns;
  std::vector<Row> _rows;

public:
  Table() = default;
  explicit Table(std::vector<Column> columns) : _columns{std::move(columns)} { }

  void push(Row row);

  const std::vector<Column>& columns() const noexcept { return _columns; }
  const std::vector<Row>& rows() const noexcept { return _rows; }
  std::size_t size() const noexcept { return _rows.size(); }
  bool empty() const noexcept { return _rows.empty(); }

  std::optional<std::size_t> column(std::string_view name) const noexcept;

  /// @throws LookupMiss for an unknown column name.
  const Cell& at(std::size_t row, std::string_view name) const;
}; // Table

/// Comma separated, header line first, RFC 4180 quoting, null as empty.
void WriteCsv(std::ostream& os, const Table& table);

// ---------- Projection of schema records ----------

/// One column per attribute field, in schema order.
template<class Rec>
std::vector<Column> ColumnsOf(const xml::Schema<Rec>& schema) {
  auto out = std::vector<Column>{};
  out.reserve(schema.attrs.size());
  for (const auto& f: schema.attrs)
    out.push_back(Column{f.name, f.type});
  return out;
} // ColumnsOf

template<class Rec>
void AppendCells(Table::Row& row, const xml::Schema<Rec>& schema,
                 const Rec& rec)
{
  for (const auto& f: schema.attrs)
    row.push_back(f.cell(rec));
} // AppendCells

} // echolab

#include "echolab/Table.hpp"
#include "echolab/Errors.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <sstream>
#include <string>

using namespace echolab;

namespace {

Table Sample() {
  auto t = Table{{{"name", ColumnType::String},
                  {"count", ColumnType::Int},
                  {"volume", ColumnType::Float}}};
  t.push({std::string{"384PP"}, std::int64_t{16}, 2.5});
  t.push({std::string{"with, comma"}, std::int64_t{0}, Cell{}});
  t.push({std::string{"say \"hi\""}, std::int64_t{-3}, 0.125});
  return t;
} // Sample

} // local

TEST(Table, Lookup) {
  const auto t = Sample();
  EXPECT_EQ(t.size(), 3u);
  EXPECT_FALSE(t.empty());
  EXPECT_EQ(t.column("count"), std::optional<std::size_t>{1});
  EXPECT_FALSE(t.column("missing").has_value());
  EXPECT_EQ(std::get<double>(t.at(0, "volume")), 2.5);
  EXPECT_TRUE(std::holds_alternative<std::monostate>(t.at(1, "volume")));
  EXPECT_THROW(t.at(0, "missing"), LookupMiss);
}

TEST(Table, CsvQuoting) {
  auto os = std::ostringstream{};
  WriteCsv(os, Sample());
  EXPECT_EQ(os.str(),
            "name,count,volume\n"
            "384PP,16,2.5\n"
            "\"with, comma\",0,\n"
            "\"say \"\"hi\"\"\",-3,0.125\n");
}

TEST(Table, CsvOfEmptyTable) {
  auto os = std::ostringstream{};
  WriteCsv(os, Table{{{"a", ColumnType::Int}, {"b", ColumnType::String}}});
  EXPECT_EQ(os.str(), "a,b\n");
}

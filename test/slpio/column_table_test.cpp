#include <doctest/doctest.h>

#include "slpio/column_table.hpp"

using namespace slp;

TEST_CASE("columns start valid and track nulls") {
  io::column value("value", io::column_type::u16, 10);
  CHECK_FALSE(value.has_validity());
  CHECK(value.is_valid(9));
  CHECK_FALSE(value.is_valid(10));

  value.set_uint(3, 0xBEEF);
  value.set_null(4);
  CHECK(value.has_validity());
  CHECK(value.uint_at(3) == 0xBEEFu);
  CHECK_FALSE(value.uint_at(4).has_value());
  CHECK(value.is_valid(5));
}

TEST_CASE("signed columns sign extend") {
  io::column value("value", io::column_type::i8, 2);
  value.set_int(0, -3);
  value.set_int(1, 7);
  CHECK(value.int_at(0) == -3);
  CHECK(value.int_at(1) == 7);
}

TEST_CASE("float reads are refused on other column types") {
  io::column value("value", io::column_type::u32, 1);
  value.set_uint(0, 1);
  CHECK_FALSE(value.float_at(0).has_value());
}

TEST_CASE("tables find columns by name") {
  io::column_table table;
  table.rows = 2;
  table.columns.emplace_back("index", io::column_type::i32, 2);
  table.columns.emplace_back("x", io::column_type::f32, 2);
  REQUIRE(table.find("x") != nullptr);
  CHECK(table.find("x")->type() == io::column_type::f32);
  CHECK(table.find("missing") == nullptr);
}

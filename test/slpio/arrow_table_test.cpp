#include <doctest/doctest.h>

#include <memory>
#include <vector>

#include <arrow/table.h>
#include <arrow/type.h>

#include "slpio/arrow_table.hpp"

using namespace slp;

namespace {

io::column_table make_table(size_t rows) {
  io::column_table table;
  table.rows = rows;
  io::column index("index", io::column_type::i32, rows);
  io::column x("x", io::column_type::f32, rows);
  io::column flag("flag", io::column_type::boolean, rows);
  io::column state("state", io::column_type::u16, rows);
  io::column seed("seed", io::column_type::u64, rows);
  for (size_t row = 0; row < rows; ++row) {
    index.set_int(row, -123 + static_cast<int64_t>(row));
    flag.set_bool(row, row % 2 == 0);
    state.set_uint(row, 0x14 + row % 5);
    seed.set_uint(row, 0x1234567890ull + row);
    if (row % 3 == 2) {
      x.set_null(row);
    } else {
      x.set_float(row, static_cast<float>(row) * 0.25f);
    }
  }
  table.columns.push_back(std::move(index));
  table.columns.push_back(std::move(x));
  table.columns.push_back(std::move(flag));
  table.columns.push_back(std::move(state));
  table.columns.push_back(std::move(seed));
  return table;
}

} // namespace

TEST_CASE("arrow files read back what was written under every codec") {
  for (auto codec : {io::column_codec::none, io::column_codec::lz4, io::column_codec::zstd}) {
    CAPTURE(static_cast<int>(codec));
    const auto table = make_table(100);
    io::arrow_write_options options;
    options.codec = codec;

    std::vector<uint8_t> bytes;
    REQUIRE(io::write_arrow_file(table, options, bytes).ok());

    io::column_table restored;
    REQUIRE(io::read_arrow_file(bytes, restored).ok());
    CHECK(restored.rows == 100);
    REQUIRE(restored.columns.size() == 5);
    CHECK(restored.columns[0].name() == "index");
    CHECK(restored.columns[1].type() == io::column_type::f32);

    const auto* x = restored.find("x");
    REQUIRE(x != nullptr);
    CHECK(x->has_validity());
    CHECK(x->float_at(1) == 0.25f);
    CHECK_FALSE(x->float_at(2).has_value());
    CHECK(restored.find("index")->int_at(0) == -123);
    CHECK(restored.find("flag")->bool_at(1) == false);
    CHECK_FALSE(restored.find("flag")->has_validity());
    CHECK(restored.find("state")->uint_at(3) == 0x17u);
    CHECK(restored.find("seed")->uint_at(99) == 0x1234567890ull + 99);
  }
}

TEST_CASE("arrow schema carries the column types and null counts") {
  std::shared_ptr<arrow::Table> converted;
  REQUIRE(io::to_arrow_table(make_table(9), 1, converted).ok());
  REQUIRE(converted != nullptr);
  CHECK(converted->num_rows() == 9);
  REQUIRE(converted->num_columns() == 5);
  CHECK(converted->schema()->field(0)->type()->Equals(arrow::int32()));
  CHECK(converted->schema()->field(1)->type()->Equals(arrow::float32()));
  CHECK(converted->schema()->field(2)->type()->Equals(arrow::boolean()));
  CHECK(converted->schema()->field(3)->type()->Equals(arrow::uint16()));
  CHECK(converted->schema()->field(4)->type()->Equals(arrow::uint64()));
  CHECK(converted->schema()->field(1)->nullable());
  CHECK(converted->column(1)->null_count() == 3);
  CHECK(converted->column(0)->null_count() == 0);
}

TEST_CASE("compressed arrow files are smaller on repetitive data") {
  io::column_table table;
  table.rows = 4096;
  table.columns.emplace_back("zero", io::column_type::u64, 4096);

  std::vector<uint8_t> plain;
  std::vector<uint8_t> packed;
  REQUIRE(io::write_arrow_file(table, {io::column_codec::none, io::k_default_compression_level, 1}, plain).ok());
  REQUIRE(io::write_arrow_file(table, {io::column_codec::zstd, io::k_default_compression_level, 1}, packed).ok());
  CHECK(packed.size() < plain.size());
}

TEST_CASE("arrow encoding does not depend on the worker count") {
  const auto table = make_table(257);
  std::vector<uint8_t> serial;
  std::vector<uint8_t> parallel;
  REQUIRE(io::write_arrow_file(table, {io::column_codec::zstd, io::k_default_compression_level, 1}, serial).ok());
  REQUIRE(io::write_arrow_file(table, {io::column_codec::zstd, io::k_default_compression_level, 4}, parallel).ok());
  CHECK(serial == parallel);
}

TEST_CASE("an empty table keeps its schema") {
  io::column_table table;
  table.columns.emplace_back("frame", io::column_type::i32, 0);
  std::vector<uint8_t> bytes;
  REQUIRE(io::write_arrow_file(table, {}, bytes).ok());

  io::column_table restored;
  REQUIRE(io::read_arrow_file(bytes, restored).ok());
  CHECK(restored.rows == 0);
  REQUIRE(restored.columns.size() == 1);
  CHECK(restored.columns[0].name() == "frame");
}

TEST_CASE("mismatched row counts are refused") {
  auto table = make_table(4);
  table.columns.emplace_back("short", io::column_type::u8, 3);
  std::vector<uint8_t> bytes;
  const auto st = io::write_arrow_file(table, {}, bytes);
  CHECK(st.code == error_code::invalid_argument);
}

TEST_CASE("arrow reader rejects foreign, truncated and damaged input") {
  io::column_table restored;
  const std::vector<uint8_t> foreign = {'{', 'U', 3, 'r', 'a', 'w'};
  CHECK(io::read_arrow_file(foreign, restored).code == error_code::malformed_header);
  CHECK(io::read_arrow_file({}, restored).code == error_code::malformed_header);

  std::vector<uint8_t> bytes;
  REQUIRE(io::write_arrow_file(make_table(16), {}, bytes).ok());

  auto truncated = bytes;
  truncated.resize(truncated.size() / 2);
  CHECK(io::read_arrow_file(truncated, restored).code == error_code::malformed_header);

  // a body region overwritten with 0xFF claims lengths and offsets far past the file
  auto damaged = bytes;
  for (size_t i = 8; i < damaged.size() / 2; ++i) {
    damaged[i] = 0xFF;
  }
  CHECK(io::read_arrow_file(damaged, restored).code == error_code::malformed_header);
  CHECK(restored.columns.empty());
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slp::io {

enum class column_type : uint8_t { boolean = 1, i8, u8, u16, i32, u32, u64, f32 };

size_t column_type_width(column_type type);

// Fixed-width column, pre-sized to its row count. Rows start valid; the validity bitmap is
// only materialized once a row is set null.
class column {
public:
  column() = default;
  column(std::string name, column_type type, size_t rows);

  const std::string& name() const { return name_; }
  column_type type() const { return type_; }
  size_t rows() const { return rows_; }

  void set_bool(size_t row, bool value);
  void set_int(size_t row, int64_t value);
  void set_uint(size_t row, uint64_t value);
  void set_float(size_t row, float value);
  void set_null(size_t row);

  bool has_validity() const { return !validity_.empty(); }
  bool is_valid(size_t row) const;

  std::optional<int64_t> int_at(size_t row) const;
  std::optional<uint64_t> uint_at(size_t row) const;
  std::optional<float> float_at(size_t row) const;
  std::optional<bool> bool_at(size_t row) const;

  const std::vector<uint8_t>& values() const { return values_; }

private:
  void store(size_t row, uint64_t bits);
  uint64_t load(size_t row) const;

  std::string name_;
  column_type type_ = column_type::u8;
  size_t rows_ = 0;
  std::vector<uint8_t> values_;
  std::vector<uint8_t> validity_;
};

struct column_table {
  uint64_t rows = 0;
  std::vector<column> columns;

  const column* find(std::string_view name) const;
};

} // namespace slp::io

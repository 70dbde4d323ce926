#include "column_table.hpp"

#include <cstring>
#include <utility>

namespace slp::io {

namespace {

size_t validity_bytes(size_t rows) { return (rows + 7) / 8; }

} // namespace

size_t column_type_width(column_type type) {
  switch (type) {
  case column_type::boolean:
  case column_type::i8:
  case column_type::u8:
    return 1;
  case column_type::u16:
    return 2;
  case column_type::i32:
  case column_type::u32:
  case column_type::f32:
    return 4;
  case column_type::u64:
    return 8;
  }
  return 0;
}

column::column(std::string name, column_type type, size_t rows)
    : name_(std::move(name)), type_(type), rows_(rows), values_(rows * column_type_width(type), 0) {}

void column::store(size_t row, uint64_t bits) {
  const size_t width = column_type_width(type_);
  uint8_t* target = values_.data() + row * width;
  for (size_t i = 0; i < width; ++i) {
    target[i] = static_cast<uint8_t>((bits >> (i * 8)) & 0xFFu);
  }
}

uint64_t column::load(size_t row) const {
  const size_t width = column_type_width(type_);
  const uint8_t* source = values_.data() + row * width;
  uint64_t bits = 0;
  for (size_t i = 0; i < width; ++i) {
    bits |= static_cast<uint64_t>(source[i]) << (i * 8);
  }
  return bits;
}

void column::set_bool(size_t row, bool value) { store(row, value ? 1 : 0); }

void column::set_int(size_t row, int64_t value) { store(row, static_cast<uint64_t>(value)); }

void column::set_uint(size_t row, uint64_t value) { store(row, value); }

void column::set_float(size_t row, float value) {
  uint32_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  store(row, bits);
}

void column::set_null(size_t row) {
  if (validity_.empty()) {
    validity_.assign(validity_bytes(rows_), 0xFF);
  }
  validity_[row / 8] &= static_cast<uint8_t>(~(1u << (row % 8)));
  store(row, 0);
}

bool column::is_valid(size_t row) const {
  if (row >= rows_) {
    return false;
  }
  return validity_.empty() || (validity_[row / 8] & (1u << (row % 8))) != 0;
}

std::optional<int64_t> column::int_at(size_t row) const {
  if (!is_valid(row)) {
    return std::nullopt;
  }
  const uint64_t bits = load(row);
  switch (type_) {
  case column_type::i8:
    return static_cast<int8_t>(bits);
  case column_type::i32:
    return static_cast<int32_t>(bits);
  default:
    return static_cast<int64_t>(bits);
  }
}

std::optional<uint64_t> column::uint_at(size_t row) const {
  if (!is_valid(row)) {
    return std::nullopt;
  }
  return load(row);
}

std::optional<float> column::float_at(size_t row) const {
  if (!is_valid(row) || type_ != column_type::f32) {
    return std::nullopt;
  }
  const auto bits = static_cast<uint32_t>(load(row));
  float value = 0;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

std::optional<bool> column::bool_at(size_t row) const {
  if (!is_valid(row)) {
    return std::nullopt;
  }
  return load(row) != 0;
}

const column* column_table::find(std::string_view name) const {
  for (const auto& entry : columns) {
    if (entry.name() == name) {
      return &entry;
    }
  }
  return nullptr;
}

} // namespace slp::io

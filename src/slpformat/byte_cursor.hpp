#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// Slippi payloads are big-endian throughout.
namespace slp::format {

class byte_writer {
public:
  explicit byte_writer(std::vector<uint8_t>& out) : out_(out) {}

  void write_u8(uint8_t value) { out_.push_back(value); }
  void write_i8(int8_t value) { out_.push_back(static_cast<uint8_t>(value)); }
  void write_bool(bool value) { out_.push_back(value ? 1 : 0); }

  void write_u16(uint16_t value) { write_be(value, 2); }
  void write_u32(uint32_t value) { write_be(value, 4); }
  void write_i32(int32_t value) { write_be(static_cast<uint32_t>(value), 4); }
  void write_u40(uint64_t value) { write_be(value, 5); }

  void write_f32(float value) {
    uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    write_u32(bits);
  }

  void write_bytes(std::span<const uint8_t> data) { out_.insert(out_.end(), data.begin(), data.end()); }

  void write_zeros(size_t count) { out_.insert(out_.end(), count, 0); }

  // pads or truncates the output to exactly `offset` bytes
  void align_to(size_t offset) { out_.resize(offset, 0); }

  size_t size() const { return out_.size(); }

private:
  void write_be(uint64_t value, size_t width) {
    for (size_t i = 0; i < width; ++i) {
      out_.push_back(static_cast<uint8_t>((value >> (8 * (width - 1 - i))) & 0xFFu));
    }
  }

  std::vector<uint8_t>& out_;
};

class byte_reader {
public:
  explicit byte_reader(std::span<const uint8_t> data, size_t base_offset = 0)
      : data_(data), base_offset_(base_offset) {}

  bool read_u8(uint8_t& value) {
    uint64_t out = 0;
    if (!read_be(out, 1)) {
      return false;
    }
    value = static_cast<uint8_t>(out);
    return true;
  }

  bool read_i8(int8_t& value) {
    uint8_t raw = 0;
    if (!read_u8(raw)) {
      return false;
    }
    value = static_cast<int8_t>(raw);
    return true;
  }

  bool read_bool(bool& value) {
    uint8_t raw = 0;
    if (!read_u8(raw)) {
      return false;
    }
    value = raw != 0;
    return true;
  }

  bool read_u16(uint16_t& value) {
    uint64_t out = 0;
    if (!read_be(out, 2)) {
      return false;
    }
    value = static_cast<uint16_t>(out);
    return true;
  }

  bool read_u32(uint32_t& value) {
    uint64_t out = 0;
    if (!read_be(out, 4)) {
      return false;
    }
    value = static_cast<uint32_t>(out);
    return true;
  }

  bool read_i32(int32_t& value) {
    uint32_t raw = 0;
    if (!read_u32(raw)) {
      return false;
    }
    value = static_cast<int32_t>(raw);
    return true;
  }

  bool read_u40(uint64_t& value) { return read_be(value, 5); }

  bool read_f32(float& value) {
    uint32_t bits = 0;
    if (!read_u32(bits)) {
      return false;
    }
    std::memcpy(&value, &bits, sizeof(value));
    return true;
  }

  template <size_t N> bool read_array(std::array<uint8_t, N>& out) {
    if (remaining() < N) {
      return false;
    }
    std::memcpy(out.data(), data_.data() + cursor_, N);
    cursor_ += N;
    return true;
  }

  bool read_span(size_t size, std::span<const uint8_t>& out) {
    if (remaining() < size) {
      return false;
    }
    out = data_.subspan(cursor_, size);
    cursor_ += size;
    return true;
  }

  bool seek(size_t position) {
    if (position > data_.size()) {
      return false;
    }
    cursor_ = position;
    return true;
  }

  bool skip(size_t count) { return seek(cursor_ + count); }

  size_t position() const { return cursor_; }
  size_t remaining() const { return data_.size() - cursor_; }
  size_t size() const { return data_.size(); }
  bool at_end() const { return cursor_ >= data_.size(); }

  // offset within the whole input, for error context
  size_t absolute_offset() const { return base_offset_ + cursor_; }

private:
  bool read_be(uint64_t& value, size_t width) {
    if (remaining() < width) {
      return false;
    }
    uint64_t out = 0;
    for (size_t i = 0; i < width; ++i) {
      out = (out << 8) | data_[cursor_ + i];
    }
    value = out;
    cursor_ += width;
    return true;
  }

  std::span<const uint8_t> data_;
  size_t base_offset_ = 0;
  size_t cursor_ = 0;
};

} // namespace slp::format

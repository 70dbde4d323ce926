#include "archive_writer.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <system_error>
#include <utility>

namespace slp::io {

namespace {

constexpr size_t k_tar_block = 512;

void put_field(std::array<char, k_tar_block>& header, size_t offset, size_t width, const std::string& value) {
  std::memcpy(header.data() + offset, value.data(), std::min(width, value.size()));
}

void put_octal(std::array<char, k_tar_block>& header, size_t offset, size_t width, uint64_t value) {
  std::string digits(width - 1, '0');
  for (size_t i = digits.size(); i > 0 && value != 0; --i) {
    digits[i - 1] = static_cast<char>('0' + (value & 7u));
    value >>= 3;
  }
  put_field(header, offset, width, digits);
}

std::array<char, k_tar_block> make_tar_header(const std::string& name, uint64_t size) {
  std::array<char, k_tar_block> header{};
  put_field(header, 0, 100, name);
  put_octal(header, 100, 8, 0644);
  put_octal(header, 108, 8, 0);
  put_octal(header, 116, 8, 0);
  put_octal(header, 124, 12, size);
  put_octal(header, 136, 12, 0);
  std::memset(header.data() + 148, ' ', 8);
  header[156] = '0';
  put_field(header, 257, 6, std::string("ustar\0", 6));
  put_field(header, 263, 2, "00");

  uint32_t checksum = 0;
  for (char c : header) {
    checksum += static_cast<uint8_t>(c);
  }
  char digits[8];
  std::snprintf(digits, sizeof(digits), "%06o", checksum);
  std::memcpy(header.data() + 148, digits, 6);
  header[154] = '\0';
  header[155] = ' ';
  return header;
}

} // namespace

bool valid_blob_name(const std::string& name) {
  return !name.empty() && name.size() < 100 && name != "." && name != ".." &&
         name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

directory_archive::directory_archive(std::filesystem::path root) : root_(std::move(root)) {}

status directory_archive::add_blob(const std::string& name, std::span<const uint8_t> bytes) {
  if (!valid_blob_name(name)) {
    return make_status(error_code::invalid_argument, "invalid blob name: " + name);
  }
  if (!prepared_) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
      log_.err("failed to create output directory", redlog::field("path", root_.string()), redlog::field("error", ec.message()));
      return make_status(error_code::io_error, "cannot create " + root_.string() + ": " + ec.message());
    }
    prepared_ = true;
  }

  const auto path = root_ / name;
  std::ofstream file(path, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!file) {
    return make_status(error_code::io_error, "cannot open " + path.string());
  }
  file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!file.good()) {
    return make_status(error_code::io_error, "failed writing " + path.string());
  }
  log_.vrb("blob written", redlog::field("path", path.string()), redlog::field("size", bytes.size()));
  return ok_status();
}

status directory_archive::finalize() {
  if (!prepared_) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
      return make_status(error_code::io_error, "cannot create " + root_.string() + ": " + ec.message());
    }
    prepared_ = true;
  }
  log_.inf("archive directory complete", redlog::field("path", root_.string()));
  return ok_status();
}

tar_archive::tar_archive(std::string path) : path_(std::move(path)) {}

status tar_archive::open() {
  if (out_) {
    return ok_status();
  }
  if (path_ == "-") {
    out_ = &std::cout;
    return ok_status();
  }
  file_.open(path_, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!file_) {
    log_.err("failed to open tarball", redlog::field("path", path_));
    return make_status(error_code::io_error, "cannot open " + path_);
  }
  out_ = &file_;
  return ok_status();
}

status tar_archive::add_blob(const std::string& name, std::span<const uint8_t> bytes) {
  if (!valid_blob_name(name)) {
    return make_status(error_code::invalid_argument, "invalid blob name: " + name);
  }
  auto st = open();
  if (!st.ok()) {
    return st;
  }

  const auto header = make_tar_header(name, bytes.size());
  out_->write(header.data(), static_cast<std::streamsize>(header.size()));
  out_->write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  const size_t padding = (k_tar_block - bytes.size() % k_tar_block) % k_tar_block;
  const std::array<char, k_tar_block> zeros{};
  out_->write(zeros.data(), static_cast<std::streamsize>(padding));
  if (!out_->good()) {
    return make_status(error_code::io_error, "failed writing " + name + " to " + path_);
  }
  log_.vrb("tar member written", redlog::field("name", name), redlog::field("size", bytes.size()));
  return ok_status();
}

status tar_archive::finalize() {
  auto st = open();
  if (!st.ok()) {
    return st;
  }
  const std::array<char, k_tar_block * 2> trailer{};
  out_->write(trailer.data(), static_cast<std::streamsize>(trailer.size()));
  out_->flush();
  if (!out_->good()) {
    return make_status(error_code::io_error, "failed finishing " + path_);
  }
  if (file_.is_open()) {
    file_.close();
  }
  log_.inf("tarball complete", redlog::field("path", path_));
  return ok_status();
}

std::unique_ptr<archive_writer> make_archive_writer(archive_kind kind, const std::string& path) {
  if (kind == archive_kind::tar) {
    return std::make_unique<tar_archive>(path);
  }
  return std::make_unique<directory_archive>(path);
}

} // namespace slp::io

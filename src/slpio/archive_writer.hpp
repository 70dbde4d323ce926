#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "slpbase/result.hpp"

namespace slp::io {

enum class archive_kind { directory, tar };

// Collects named output blobs. Names are flat file names; finalize() must be called once.
class archive_writer {
public:
  virtual ~archive_writer() = default;

  virtual status add_blob(const std::string& name, std::span<const uint8_t> bytes) = 0;
  virtual status finalize() = 0;
};

class directory_archive final : public archive_writer {
public:
  explicit directory_archive(std::filesystem::path root);

  status add_blob(const std::string& name, std::span<const uint8_t> bytes) override;
  status finalize() override;

private:
  std::filesystem::path root_;
  bool prepared_ = false;
  redlog::logger log_ = redlog::get_logger("slpkit.archive");
};

// ustar stream with zeroed timestamps and owners, so identical blobs give identical archives
class tar_archive final : public archive_writer {
public:
  // "-" writes to standard output
  explicit tar_archive(std::string path);

  status add_blob(const std::string& name, std::span<const uint8_t> bytes) override;
  status finalize() override;

private:
  status open();

  std::string path_;
  std::ofstream file_;
  std::ostream* out_ = nullptr;
  redlog::logger log_ = redlog::get_logger("slpkit.archive");
};

std::unique_ptr<archive_writer> make_archive_writer(archive_kind kind, const std::string& path);

// rejects empty names, separators and parent references
bool valid_blob_name(const std::string& name);

} // namespace slp::io

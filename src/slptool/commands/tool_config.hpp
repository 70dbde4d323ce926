#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "slpio/archive_writer.hpp"
#include "slpio/arrow_table.hpp"

namespace slptool::commands {

// defaults read from SLPKIT_* environment variables; command-line flags take precedence
struct tool_config {
  uint32_t threads = 0;
  slp::io::column_codec codec = slp::io::column_codec::none;
  int compression_level = slp::io::k_default_compression_level;
  slp::io::archive_kind container = slp::io::archive_kind::directory;

  static tool_config from_environment();
};

std::optional<slp::io::column_codec> parse_codec(const std::string& value);
std::optional<slp::io::archive_kind> parse_container(const std::string& value);

} // namespace slptool::commands

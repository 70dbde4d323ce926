#include "tool_config.hpp"

#include "slpbase/env_config.hpp"
#include "slpbase/keywords.hpp"

namespace slptool::commands {

tool_config tool_config::from_environment() {
  slp::util::env_config env("SLPKIT");

  tool_config config;
  config.threads = env.get<uint32_t>("THREADS", config.threads);
  config.codec = env.get_enum<slp::io::column_codec>(
      {{"none", slp::io::column_codec::none}, {"lz4", slp::io::column_codec::lz4}, {"zstd", slp::io::column_codec::zstd}},
      "COMPRESSION", config.codec
  );
  config.compression_level = env.get<int>("COMPRESSION_LEVEL", config.compression_level);
  config.container = env.get_enum<slp::io::archive_kind>(
      {{"dir", slp::io::archive_kind::directory}, {"tar", slp::io::archive_kind::tar}}, "CONTAINER", config.container
  );
  return config;
}

std::optional<slp::io::column_codec> parse_codec(const std::string& value) {
  return slp::util::match_keyword<slp::io::column_codec>(
      value, {{"none", slp::io::column_codec::none}, {"lz4", slp::io::column_codec::lz4}, {"zstd", slp::io::column_codec::zstd}}
  );
}

std::optional<slp::io::archive_kind> parse_container(const std::string& value) {
  return slp::util::match_keyword<slp::io::archive_kind>(
      value, {{"dir", slp::io::archive_kind::directory},
              {"directory", slp::io::archive_kind::directory},
              {"tar", slp::io::archive_kind::tar}}
  );
}

} // namespace slptool::commands

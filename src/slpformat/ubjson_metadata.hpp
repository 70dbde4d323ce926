#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>

#include "slpbase/result.hpp"

namespace slp::format {

struct side_channel_player {
  std::optional<std::string> netplay_name;
  std::optional<std::string> connect_code;
  std::map<uint8_t, uint32_t> characters; // internal character id -> frames
};

// the optional `metadata` object that follows the raw event block
struct side_channel_metadata {
  std::optional<std::string> start_at;
  std::optional<int32_t> last_frame;
  std::optional<std::string> played_on;
  std::map<uint8_t, side_channel_player> players; // keyed by zero-based port
};

// `block` starts at the object's opening '{'; trailing container bytes are ignored.
status parse_side_channel(std::span<const uint8_t> block, side_channel_metadata& out);

} // namespace slp::format

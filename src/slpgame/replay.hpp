#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "slpformat/diagnostic.hpp"
#include "slpformat/event_format.hpp"

namespace slp::game {

using format::decode_diagnostic;
using format::format_version;
using format::frame_bookend_info;
using format::frame_start_info;
using format::game_end;
using format::game_start;
using format::item_state;
using format::post_frame;
using format::pre_frame;

struct character_data {
  std::optional<pre_frame> pre;
  std::optional<post_frame> post;
};

struct port_frame {
  uint8_t port = 0;
  character_data leader;
  std::optional<character_data> follower; // Ice Climbers only
};

struct frame {
  int32_t index = 0;
  std::optional<frame_start_info> start;
  std::vector<port_frame> ports; // parallel to game_start::players
  std::vector<item_state> items;
  std::optional<frame_bookend_info> end;
  bool complete = false;
  bool filled = false; // inserted to close a gap in the stream
};

struct player_metadata {
  uint8_t port = 0;
  std::map<uint8_t, uint32_t> characters; // internal character id -> frames
  std::optional<std::string> netplay_name;
  std::optional<std::string> connect_code;
};

struct replay_metadata {
  std::optional<std::string> start_at;
  std::optional<std::string> played_on;
  std::optional<int32_t> last_frame;
  size_t frame_count = 0;
  std::vector<player_metadata> players;
};

struct replay {
  game_start start;
  std::vector<uint8_t> start_raw;
  std::vector<frame> frames;
  std::optional<game_end> end;
  std::vector<uint8_t> end_raw;
  replay_metadata metadata;
  std::vector<uint8_t> gecko_codes;
  std::vector<decode_diagnostic> diagnostics;
  bool partial = false;

  const format_version& version() const { return start.slippi; }
};

} // namespace slp::game

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "slpgame/replay.hpp"

#include "node.hpp"

namespace slp::query {

struct view_options {
  bool include_frames = true;
};

// Port slots render as "P1".."P4".
std::string port_name(uint8_t port);

// The returned tree reads from `replay` lazily; it must not outlive it.
node replay_node(const game::replay& replay, const view_options& options = {});

node start_node(const format::game_start& start);
node end_node(const std::optional<format::game_end>& end);
node metadata_node(const game::replay& replay);
node frames_node(const game::replay& replay);
node frame_node(const game::frame& frame);

} // namespace slp::query

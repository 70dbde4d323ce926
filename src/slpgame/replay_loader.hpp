#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "slpbase/result.hpp"

#include "replay.hpp"

namespace slp::game {

// Reads a whole file, or standard input when `path` is "-".
status read_replay_bytes(const std::string& path, std::vector<uint8_t>& out);

// Decodes a complete .slp image. A truncated_stream status comes with a usable partial
// replay in `value`; every other error leaves `value` empty.
result<replay> load_replay(std::span<const uint8_t> bytes);

result<replay> load_replay_file(const std::string& path);

} // namespace slp::game

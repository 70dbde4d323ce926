#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "slpbase/result.hpp"
#include "slpgame/replay.hpp"

#include "arrow_table.hpp"
#include "column_table.hpp"

namespace slp::io {

struct columnar_options {
  size_t workers = 0; // 0 = hardware concurrency
  column_codec codec = column_codec::none;
  int compression_level = k_default_compression_level;
};

// One row per frame: `index`, frame start/end fields, then per active port the leader
// slot and, when any frame carries one, the follower slot. Fields newer than the
// replay's version get no column; missing rows are null.
status build_frame_table(const game::replay& replay, size_t workers, column_table& out);

// One row per item appearance, keyed by a `frame` column.
status build_item_table(const game::replay& replay, size_t workers, column_table& out);

// Arrow IPC file bytes of the tables above
status encode_frame_table(const game::replay& replay, const columnar_options& options, std::vector<uint8_t>& out);
status encode_item_table(const game::replay& replay, const columnar_options& options, std::vector<uint8_t>& out);

} // namespace slp::io

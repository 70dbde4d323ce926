#pragma once

#include "slpbase/result.hpp"
#include "slpgame/replay.hpp"

#include "archive_writer.hpp"
#include "column_encoder.hpp"
#include "json_encoder.hpp"

namespace slp::io {

struct replay_archive_options {
  json_options json;
  columnar_options columns;
};

// Writes start.json/raw, end.json/raw, metadata.json, frames.arrow and items.arrow
// (end and items only when present) and finalizes the archive.
status write_replay_archive(
    const game::replay& replay, const replay_archive_options& options, archive_writer& archive
);

} // namespace slp::io

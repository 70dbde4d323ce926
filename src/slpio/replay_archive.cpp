#include "replay_archive.hpp"

#include <string>
#include <vector>

#include <redlog.hpp>

#include "slpformat/event_codec.hpp"
#include "slpquery/model_view.hpp"

namespace slp::io {

namespace {

std::span<const uint8_t> as_bytes(const std::string& text) {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

status add_json(archive_writer& archive, const std::string& name, const query::node& value, const json_options& options) {
  std::string text = dump_json(value, options);
  text.push_back('\n');
  return archive.add_blob(name, as_bytes(text));
}

} // namespace

status write_replay_archive(
    const game::replay& replay, const replay_archive_options& options, archive_writer& archive
) {
  auto log = redlog::get_logger("slpkit.archive");

  auto st = add_json(archive, "start.json", query::start_node(replay.start), options.json);
  if (!st.ok()) {
    return st;
  }
  const std::vector<uint8_t> start_raw =
      replay.start_raw.empty() ? format::encode_game_start(replay.start) : replay.start_raw;
  st = archive.add_blob("start.raw", start_raw);
  if (!st.ok()) {
    return st;
  }

  if (replay.end) {
    st = add_json(archive, "end.json", query::end_node(replay.end), options.json);
    if (!st.ok()) {
      return st;
    }
    const std::vector<uint8_t> end_raw =
        replay.end_raw.empty() ? format::encode_game_end(*replay.end, replay.version()) : replay.end_raw;
    st = archive.add_blob("end.raw", end_raw);
    if (!st.ok()) {
      return st;
    }
  }

  st = add_json(archive, "metadata.json", query::metadata_node(replay), options.json);
  if (!st.ok()) {
    return st;
  }

  std::vector<uint8_t> block;
  st = encode_frame_table(replay, options.columns, block);
  if (!st.ok()) {
    return st;
  }
  st = archive.add_blob("frames.arrow", block);
  if (!st.ok()) {
    return st;
  }

  bool has_items = false;
  for (const auto& frame : replay.frames) {
    if (!frame.items.empty()) {
      has_items = true;
      break;
    }
  }
  if (has_items) {
    block.clear();
    st = encode_item_table(replay, options.columns, block);
    if (!st.ok()) {
      return st;
    }
    st = archive.add_blob("items.arrow", block);
    if (!st.ok()) {
      return st;
    }
  }

  log.dbg("replay archive assembled", redlog::field("frames", replay.frames.size()),
          redlog::field("items", has_items));
  return archive.finalize();
}

} // namespace slp::io

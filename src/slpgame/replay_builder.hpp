#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "slpbase/result.hpp"
#include "slpformat/event_stream.hpp"
#include "slpformat/ubjson_metadata.hpp"

#include "replay.hpp"

namespace slp::game {

// inconsistent_replay unless the per-character counts add up to `observed` leader post-frames
status check_character_histogram(uint8_t port, const std::map<uint8_t, uint32_t>& characters, uint64_t observed);

// Accumulates decoded events into a replay. Frames are stored densely from the first
// index seen; rollback re-sends overwrite earlier data and are recorded.
class replay_builder {
public:
  replay_builder() = default;

  // non-ok only when the event leaves the replay unusable
  status apply(const format::stream_event& event);

  void add_diagnostics(std::vector<decode_diagnostic> diagnostics);

  // derives metadata and checks the character histograms; `truncated` marks the replay partial
  status finish(bool truncated, const std::optional<format::side_channel_metadata>& side_channel, replay& out);

  bool has_start() const { return started_; }
  size_t frame_count() const { return replay_.frames.size(); }

private:
  frame* frame_for(int32_t index, size_t offset, uint8_t code);
  character_data* character_for(frame& target, uint8_t port, bool follower, size_t offset, uint8_t code);
  void note(format::diagnostic_kind kind, size_t offset, uint8_t code, std::optional<int32_t> frame_index, std::string message);

  void on_game_start(const format::game_start_event& event);
  void on_pre_frame(const format::pre_frame_event& event, size_t offset);
  void on_post_frame(const format::post_frame_event& event, size_t offset);
  void on_item(const format::item_event& event, size_t offset);
  void on_frame_start(const format::frame_start_event& event, size_t offset);
  void on_frame_bookend(const format::frame_bookend_event& event, size_t offset);
  void on_game_end(const format::game_end_event& event, size_t offset);

  void mark_complete_frames();
  status derive_metadata(const std::optional<format::side_channel_metadata>& side_channel);

  replay replay_{};
  std::vector<decode_diagnostic> diagnostics_{};
  // leader post-frames accepted per player slot, re-sends excluded
  std::vector<uint64_t> leader_posts_{};
  bool started_ = false;
  redlog::logger log_ = redlog::get_logger("slpkit.builder");
};

} // namespace slp::game

#include "replay_builder.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace slp::game {

namespace {

using format::diagnostic_kind;
using format::event_code;

constexpr uint8_t code_of(event_code code) { return static_cast<uint8_t>(code); }

// one hour at 60 fps; a larger jump is a damaged frame index, not missing frames
constexpr int64_t k_max_frame_gap = 60 * 60 * 60;

// frames without bookends (before 3.0) count as complete once every active slot has both halves
bool has_both_halves(const frame& target) {
  if (target.ports.empty()) {
    return false;
  }
  for (const auto& port : target.ports) {
    if (!port.leader.pre || !port.leader.post) {
      return false;
    }
    if (port.follower && port.follower->pre && !port.follower->post) {
      return false;
    }
  }
  return true;
}

} // namespace

status replay_builder::apply(const format::stream_event& event) {
  const bool scoped = !std::holds_alternative<format::game_start_event>(event.event) &&
                      !std::holds_alternative<format::gecko_list_event>(event.event);
  if (!started_ && scoped) {
    note(diagnostic_kind::rejected_event, event.offset, event.code, std::nullopt, "event before game start");
    log_.wrn(
        "event before game start rejected", redlog::field("code", static_cast<int>(event.code)),
        redlog::field("offset", event.offset)
    );
    return ok_status();
  }

  std::visit(
      [&](const auto& entry) {
        using entry_t = std::decay_t<decltype(entry)>;
        if constexpr (std::is_same_v<entry_t, format::game_start_event>) {
          on_game_start(entry);
        } else if constexpr (std::is_same_v<entry_t, format::pre_frame_event>) {
          on_pre_frame(entry, event.offset);
        } else if constexpr (std::is_same_v<entry_t, format::post_frame_event>) {
          on_post_frame(entry, event.offset);
        } else if constexpr (std::is_same_v<entry_t, format::item_event>) {
          on_item(entry, event.offset);
        } else if constexpr (std::is_same_v<entry_t, format::frame_start_event>) {
          on_frame_start(entry, event.offset);
        } else if constexpr (std::is_same_v<entry_t, format::frame_bookend_event>) {
          on_frame_bookend(entry, event.offset);
        } else if constexpr (std::is_same_v<entry_t, format::game_end_event>) {
          on_game_end(entry, event.offset);
        } else if constexpr (std::is_same_v<entry_t, format::gecko_list_event>) {
          replay_.gecko_codes = entry.codes;
          log_.dbg("gecko codes stored", redlog::field("size", entry.codes.size()));
        } else {
          log_.trc("unreassembled message fragment ignored", redlog::field("offset", event.offset));
        }
      },
      event.event
  );
  return ok_status();
}

status check_character_histogram(uint8_t port, const std::map<uint8_t, uint32_t>& characters, uint64_t observed) {
  uint64_t total = 0;
  for (const auto& [character, count] : characters) {
    total += count;
  }
  if (total != observed) {
    return make_status(
        error_code::inconsistent_replay, "character histogram for port " + std::to_string(port + 1) + " sums to " +
                                             std::to_string(total) + " but " + std::to_string(observed) +
                                             " post-frames were accepted"
    );
  }
  return ok_status();
}

void replay_builder::add_diagnostics(std::vector<decode_diagnostic> diagnostics) {
  for (auto& diagnostic : diagnostics) {
    diagnostics_.push_back(std::move(diagnostic));
  }
}

void replay_builder::note(
    diagnostic_kind kind, size_t offset, uint8_t code, std::optional<int32_t> frame_index, std::string message
) {
  decode_diagnostic diagnostic;
  diagnostic.kind = kind;
  diagnostic.offset = offset;
  diagnostic.code = code;
  diagnostic.frame = frame_index;
  diagnostic.message = std::move(message);
  diagnostics_.push_back(std::move(diagnostic));
}

void replay_builder::on_game_start(const format::game_start_event& event) {
  replay_.start = event.data;
  replay_.start_raw = event.raw;
  leader_posts_.assign(event.data.players.size(), 0);
  started_ = true;
  log_.inf(
      "game start", redlog::field("version", event.data.slippi.to_string()), redlog::field("stage", event.data.stage),
      redlog::field("players", event.data.players.size())
  );
}

frame* replay_builder::frame_for(int32_t index, size_t offset, uint8_t code) {
  auto& frames = replay_.frames;
  auto make_frame = [&](int32_t frame_index, bool filled) {
    frame created;
    created.index = frame_index;
    created.filled = filled;
    created.ports.reserve(replay_.start.players.size());
    for (const auto& player : replay_.start.players) {
      port_frame entry;
      entry.port = player.port;
      created.ports.push_back(std::move(entry));
    }
    frames.push_back(std::move(created));
  };

  if (frames.empty()) {
    make_frame(index, false);
    return &frames.back();
  }

  const int32_t first = frames.front().index;
  if (index < first) {
    note(
        diagnostic_kind::rejected_event, offset, code, index,
        "frame " + std::to_string(index) + " precedes first frame " + std::to_string(first)
    );
    log_.wrn("event before first frame rejected", redlog::field("frame", index), redlog::field("first", first));
    return nullptr;
  }

  const int64_t next = static_cast<int64_t>(first) + static_cast<int64_t>(frames.size());
  if (index >= next) {
    if (index - next > k_max_frame_gap) {
      note(
          diagnostic_kind::rejected_event, offset, code, index,
          "frame " + std::to_string(index) + " jumps " + std::to_string(index - next) + " frames past " +
              std::to_string(next)
      );
      log_.wrn("event far past the last frame rejected", redlog::field("frame", index), redlog::field("next", next));
      return nullptr;
    }
    if (index > next) {
      note(
          diagnostic_kind::frame_gap, offset, code, index,
          "frames " + std::to_string(next) + ".." + std::to_string(index - 1) + " missing"
      );
      log_.wrn("frame gap filled", redlog::field("from", next), redlog::field("to", index - 1));
      for (int64_t missing = next; missing < index; ++missing) {
        make_frame(static_cast<int32_t>(missing), true);
      }
    }
    make_frame(index, false);
    return &frames.back();
  }

  auto& existing = frames[static_cast<size_t>(index - first)];
  if (existing.filled) {
    existing.filled = false;
  }
  return &existing;
}

character_data* replay_builder::character_for(frame& target, uint8_t port, bool follower, size_t offset, uint8_t code) {
  for (auto& entry : target.ports) {
    if (entry.port != port) {
      continue;
    }
    if (!follower) {
      return &entry.leader;
    }
    if (!entry.follower) {
      entry.follower.emplace();
    }
    return &*entry.follower;
  }
  note(
      diagnostic_kind::rejected_event, offset, code, target.index,
      "event for inactive port " + std::to_string(port + 1)
  );
  log_.wrn("event for inactive port rejected", redlog::field("port", port + 1), redlog::field("frame", target.index));
  return nullptr;
}

void replay_builder::on_pre_frame(const format::pre_frame_event& event, size_t offset) {
  const uint8_t code = code_of(event_code::pre_frame);
  auto* target = frame_for(event.frame, offset, code);
  if (!target) {
    return;
  }
  auto* slot = character_for(*target, event.port, event.is_follower, offset, code);
  if (!slot) {
    return;
  }
  if (slot->pre) {
    note(
        diagnostic_kind::rollback, offset, code, event.frame,
        "pre-frame for port " + std::to_string(event.port + 1) + " re-sent, keeping latest"
    );
    log_.vrb("rollback pre-frame", redlog::field("frame", event.frame), redlog::field("port", event.port + 1));
  }
  slot->pre = event.data;
}

void replay_builder::on_post_frame(const format::post_frame_event& event, size_t offset) {
  const uint8_t code = code_of(event_code::post_frame);
  auto* target = frame_for(event.frame, offset, code);
  if (!target) {
    return;
  }
  auto* slot = character_for(*target, event.port, event.is_follower, offset, code);
  if (!slot) {
    return;
  }
  if (slot->post) {
    note(
        diagnostic_kind::rollback, offset, code, event.frame,
        "post-frame for port " + std::to_string(event.port + 1) + " re-sent, keeping latest"
    );
    log_.vrb("rollback post-frame", redlog::field("frame", event.frame), redlog::field("port", event.port + 1));
  } else if (!event.is_follower) {
    for (size_t i = 0; i < target->ports.size() && i < leader_posts_.size(); ++i) {
      if (target->ports[i].port == event.port) {
        leader_posts_[i] += 1;
      }
    }
  }
  slot->post = event.data;
}

void replay_builder::on_item(const format::item_event& event, size_t offset) {
  auto* target = frame_for(event.frame, offset, code_of(event_code::item));
  if (!target) {
    return;
  }
  target->items.push_back(event.data);
}

void replay_builder::on_frame_start(const format::frame_start_event& event, size_t offset) {
  auto* target = frame_for(event.frame, offset, code_of(event_code::frame_start));
  if (!target) {
    return;
  }
  if (target->start) {
    // a rolled-back frame is re-sent in full, items included
    log_.trc("frame restarted", redlog::field("frame", event.frame), redlog::field("items", target->items.size()));
    target->items.clear();
    target->complete = false;
  }
  target->start = event.data;
}

void replay_builder::on_frame_bookend(const format::frame_bookend_event& event, size_t offset) {
  auto* target = frame_for(event.frame, offset, code_of(event_code::frame_bookend));
  if (!target) {
    return;
  }
  target->end = event.data;
  target->complete = true;
}

void replay_builder::on_game_end(const format::game_end_event& event, size_t offset) {
  if (replay_.end) {
    note(diagnostic_kind::skipped_event, offset, code_of(event_code::game_end), std::nullopt, "repeated game end");
  }
  replay_.end = event.data;
  replay_.end_raw = event.raw;
  log_.inf("game end", redlog::field("method", event.data.method), redlog::field("frames", replay_.frames.size()));
}

void replay_builder::mark_complete_frames() {
  if (replay_.version() >= format_version{3, 0, 0}) {
    return;
  }
  for (auto& target : replay_.frames) {
    target.complete = has_both_halves(target);
  }
}

status replay_builder::derive_metadata(const std::optional<format::side_channel_metadata>& side_channel) {
  auto& metadata = replay_.metadata;
  metadata.frame_count = replay_.frames.size();
  if (!replay_.frames.empty()) {
    metadata.last_frame = replay_.frames.back().index;
  }

  metadata.players.clear();
  for (size_t slot = 0; slot < replay_.start.players.size(); ++slot) {
    const auto& player = replay_.start.players[slot];
    player_metadata entry;
    entry.port = player.port;

    for (const auto& target : replay_.frames) {
      if (const auto& post = target.ports[slot].leader.post) {
        entry.characters[post->character] += 1;
      }
    }
    auto st = check_character_histogram(player.port, entry.characters, leader_posts_[slot]);
    if (!st.ok()) {
      return st;
    }

    if (player.netplay) {
      entry.netplay_name = player.netplay->name;
      entry.connect_code = player.netplay->code;
    }
    if (side_channel) {
      auto found = side_channel->players.find(player.port);
      if (found != side_channel->players.end()) {
        if (found->second.netplay_name) {
          entry.netplay_name = found->second.netplay_name;
        }
        if (found->second.connect_code) {
          entry.connect_code = found->second.connect_code;
        }
        if (!replay_.partial && !found->second.characters.empty() && found->second.characters != entry.characters) {
          note(
              diagnostic_kind::metadata_mismatch, 0, 0, std::nullopt,
              "side-channel character counts for port " + std::to_string(player.port + 1) +
                  " differ from decoded frames"
          );
          log_.wrn("side-channel character counts disagree", redlog::field("port", player.port + 1));
        }
      }
    }
    metadata.players.push_back(std::move(entry));
  }

  if (side_channel) {
    metadata.start_at = side_channel->start_at;
    metadata.played_on = side_channel->played_on;
    if (!replay_.partial && side_channel->last_frame && metadata.last_frame &&
        *side_channel->last_frame != *metadata.last_frame) {
      note(
          diagnostic_kind::metadata_mismatch, 0, 0, std::nullopt,
          "side-channel last frame " + std::to_string(*side_channel->last_frame) + " differs from decoded " +
              std::to_string(*metadata.last_frame)
      );
      log_.wrn(
          "side-channel last frame disagrees", redlog::field("recorded", *side_channel->last_frame),
          redlog::field("decoded", *metadata.last_frame)
      );
    }
  }
  return ok_status();
}

status replay_builder::finish(
    bool truncated, const std::optional<format::side_channel_metadata>& side_channel, replay& out
) {
  if (!started_) {
    return make_status(error_code::malformed_event, "replay has no game start event");
  }

  replay_.partial = truncated || !replay_.end;
  mark_complete_frames();

  auto st = derive_metadata(side_channel);
  if (!st.ok()) {
    log_.err("replay rejected", redlog::field("error", st.message));
    return st;
  }

  replay_.diagnostics = std::move(diagnostics_);
  diagnostics_.clear();

  log_.dbg(
      "replay built", redlog::field("frames", replay_.metadata.frame_count),
      redlog::field("diagnostics", replay_.diagnostics.size()), redlog::field("partial", replay_.partial)
  );
  out = std::move(replay_);
  replay_ = replay{};
  started_ = false;
  return ok_status();
}

} // namespace slp::game

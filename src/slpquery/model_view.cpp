#include "model_view.hpp"

#include <array>
#include <type_traits>
#include <utility>
#include <vector>

#include "slpformat/diagnostic.hpp"

namespace slp::query {

namespace {

using game::label_category;

node u(uint64_t value, std::optional<label_category> label = std::nullopt) {
  return node::unsigned_integer(value, label);
}
node i(int64_t value) { return node::integer(value); }
node f(float value) { return node::floating(static_cast<double>(value)); }
node b(bool value) { return node::boolean(value); }
node s(std::string value) { return node::string(std::move(value)); }

template <typename T, typename Convert> node opt(const std::optional<T>& value, Convert convert) {
  return value ? convert(*value) : node{};
}

template <typename T, size_t N> node array_node(const std::array<T, N>& values) {
  std::vector<node> items;
  items.reserve(N);
  for (const auto& value : values) {
    if constexpr (std::is_signed_v<T>) {
      items.push_back(i(value));
    } else {
      items.push_back(u(value));
    }
  }
  return node::sequence(std::move(items));
}

node point_node(const format::point& value) { return node::record({{"x", f(value.x)}, {"y", f(value.y)}}); }

node player_node(const format::player_config& player) {
  return node::record({
      {"port", s(port_name(player.port))},
      {"character", u(player.character, label_category::character_external)},
      {"type", u(player.type, label_category::player_type)},
      {"stocks", u(player.stocks)},
      {"costume", u(player.costume)},
      {"team_shade", u(player.team_shade)},
      {"handicap", u(player.handicap)},
      {"team_id", u(player.team_id)},
      {"bitfield", u(player.bitfield)},
      {"cpu_level", u(player.cpu_level)},
      {"offense_ratio", f(player.offense_ratio)},
      {"defense_ratio", f(player.defense_ratio)},
      {"model_scale", f(player.model_scale)},
      {"ucf", opt(player.ucf,
                  [](const format::ucf_settings& ucf) {
                    return node::record({{"dash_back", u(ucf.dash_back)}, {"shield_drop", u(ucf.shield_drop)}});
                  })},
      {"name_tag", opt(player.name_tag, [](const std::string& tag) { return s(tag); })},
      {"netplay", opt(player.netplay,
                      [](const format::netplay_identity& netplay) {
                        return node::record({
                            {"name", s(netplay.name)},
                            {"code", s(netplay.code)},
                            {"suid", opt(netplay.suid, [](const std::string& suid) { return s(suid); })},
                        });
                      })},
  });
}

node pre_node(const format::pre_frame& pre) {
  return node::record({
      {"random_seed", u(pre.random_seed)},
      {"state", u(pre.state, label_category::action_state)},
      {"position", point_node(pre.position)},
      {"direction", f(pre.direction)},
      {"joystick", point_node(pre.joystick)},
      {"cstick", point_node(pre.cstick)},
      {"triggers", node::record({
                       {"logical", f(pre.trigger.logical)},
                       {"physical", node::record({{"l", f(pre.trigger.physical.l)}, {"r", f(pre.trigger.physical.r)}})},
                   })},
      {"buttons", node::record({{"logical", u(pre.button.logical)}, {"physical", u(pre.button.physical)}})},
      {"raw_analog_x", opt(pre.raw_analog_x, [](int8_t v) { return i(v); })},
      {"damage", opt(pre.damage, [](float v) { return f(v); })},
      {"raw_analog_y", opt(pre.raw_analog_y, [](int8_t v) { return i(v); })},
  });
}

node post_node(const format::post_frame& post) {
  return node::record({
      {"character", u(post.character, label_category::character_internal)},
      {"state", u(post.state, label_category::action_state)},
      {"position", point_node(post.position)},
      {"direction", f(post.direction)},
      {"damage", f(post.damage)},
      {"shield", f(post.shield)},
      {"last_attack_landed", u(post.last_attack_landed)},
      {"combo_count", u(post.combo_count)},
      {"last_hit_by", u(post.last_hit_by)},
      {"stocks", u(post.stocks)},
      {"state_age", opt(post.state_age, [](float v) { return f(v); })},
      {"flags", opt(post.flags, [](uint64_t v) { return u(v); })},
      {"misc_as", opt(post.misc_as, [](float v) { return f(v); })},
      {"airborne", opt(post.airborne, [](bool v) { return b(v); })},
      {"ground", opt(post.ground, [](uint16_t v) { return u(v); })},
      {"jumps", opt(post.jumps, [](uint8_t v) { return u(v); })},
      {"l_cancel", opt(post.l_cancel, [](uint8_t v) { return u(v, label_category::l_cancel); })},
      {"hurtbox_state", opt(post.hurtbox_state, [](uint8_t v) { return u(v, label_category::hurtbox_state); })},
      {"velocities", opt(post.velocity,
                         [](const format::velocities& v) {
                           return node::record({
                               {"self_x_air", f(v.self_x_air)},
                               {"self_y", f(v.self_y)},
                               {"knockback_x", f(v.knockback_x)},
                               {"knockback_y", f(v.knockback_y)},
                               {"self_x_ground", f(v.self_x_ground)},
                           });
                         })},
      {"hitlag", opt(post.hitlag, [](float v) { return f(v); })},
      {"animation_index", opt(post.animation_index, [](uint32_t v) { return u(v); })},
  });
}

node character_node(const game::character_data& data) {
  return node::record({
      {"pre", opt(data.pre, pre_node)},
      {"post", opt(data.post, post_node)},
  });
}

node item_node(const format::item_state& item) {
  return node::record({
      {"type", u(item.type, label_category::item_type)},
      {"state", u(item.state)},
      {"direction", f(item.direction)},
      {"velocity", point_node(item.velocity)},
      {"position", point_node(item.position)},
      {"damage", u(item.damage)},
      {"timer", f(item.timer)},
      {"id", u(item.id)},
      {"misc", opt(item.misc, [](const std::array<uint8_t, 4>& misc) { return array_node(misc); })},
      {"owner", opt(item.owner, [](int8_t v) { return i(v); })},
  });
}

node diagnostic_node(const format::decode_diagnostic& diagnostic) {
  return node::record({
      {"kind", s(std::string(format::diagnostic_kind_name(diagnostic.kind)))},
      {"offset", u(diagnostic.offset)},
      {"frame", opt(diagnostic.frame, [](int32_t v) { return i(v); })},
      {"message", s(diagnostic.message)},
  });
}

} // namespace

std::string port_name(uint8_t port) { return "P" + std::to_string(static_cast<unsigned>(port) + 1); }

node start_node(const format::game_start& start) {
  std::vector<node> players;
  players.reserve(start.players.size());
  for (const auto& player : start.players) {
    players.push_back(player_node(player));
  }

  return node::record({
      {"version", node::sequence({u(start.slippi.major), u(start.slippi.minor), u(start.slippi.revision)})},
      {"bitfield", array_node(start.bitfield)},
      {"is_raining_bombs", b(start.is_raining_bombs)},
      {"is_teams", b(start.is_teams)},
      {"item_spawn_frequency", i(start.item_spawn_frequency)},
      {"self_destruct_score", i(start.self_destruct_score)},
      {"stage", u(start.stage, label_category::stage)},
      {"timer", u(start.timer)},
      {"item_spawn_bitfield", array_node(start.item_spawn_bitfield)},
      {"damage_ratio", f(start.damage_ratio)},
      {"players", node::sequence(std::move(players))},
      {"random_seed", u(start.random_seed)},
      {"is_pal", opt(start.is_pal, [](bool v) { return b(v); })},
      {"is_frozen_ps", opt(start.is_frozen_ps, [](bool v) { return b(v); })},
      {"scene", opt(start.scene,
                    [](const format::scene_info& scene) {
                      return node::record({{"minor", u(scene.minor)}, {"major", u(scene.major)}});
                    })},
      {"language", opt(start.language, [](uint8_t v) { return u(v); })},
      {"match", opt(start.match,
                    [](const format::match_info& match) {
                      return node::record({
                          {"id", s(match.id)},
                          {"game_number", u(match.game_number)},
                          {"tiebreaker_number", u(match.tiebreaker_number)},
                      });
                    })},
  });
}

node end_node(const std::optional<format::game_end>& end) {
  return opt(end, [](const format::game_end& value) {
    return node::record({
        {"method", u(value.method, label_category::end_method)},
        {"lras_initiator", opt(value.lras_initiator, [](int8_t v) { return i(v); })},
        {"placements", opt(value.placements, [](const std::array<int8_t, 4>& p) { return array_node(p); })},
    });
  });
}

node metadata_node(const game::replay& replay) {
  const auto& metadata = replay.metadata;

  std::vector<node> players;
  for (const auto& player : metadata.players) {
    std::vector<node> characters;
    for (const auto& [character, count] : player.characters) {
      characters.push_back(node::record({
          {"character", u(character, label_category::character_internal)},
          {"frames", u(count)},
      }));
    }
    players.push_back(node::record({
        {"port", s(port_name(player.port))},
        {"characters", node::sequence(std::move(characters))},
        {"netplay_name", opt(player.netplay_name, [](const std::string& v) { return s(v); })},
        {"connect_code", opt(player.connect_code, [](const std::string& v) { return s(v); })},
    }));
  }

  std::vector<node> diagnostics;
  diagnostics.reserve(replay.diagnostics.size());
  for (const auto& diagnostic : replay.diagnostics) {
    diagnostics.push_back(diagnostic_node(diagnostic));
  }

  return node::record({
      {"start_at", opt(metadata.start_at, [](const std::string& v) { return s(v); })},
      {"played_on", opt(metadata.played_on, [](const std::string& v) { return s(v); })},
      {"last_frame", opt(metadata.last_frame, [](int32_t v) { return i(v); })},
      {"frame_count", u(metadata.frame_count)},
      {"players", node::sequence(std::move(players))},
      {"partial", b(replay.partial)},
      {"diagnostics", node::sequence(std::move(diagnostics))},
  });
}

node frame_node(const game::frame& frame) {
  std::vector<node> ports;
  ports.reserve(frame.ports.size());
  for (const auto& port : frame.ports) {
    ports.push_back(node::record({
        {"port", s(port_name(port.port))},
        {"leader", character_node(port.leader)},
        {"follower", opt(port.follower, character_node)},
    }));
  }

  std::vector<node> items;
  items.reserve(frame.items.size());
  for (const auto& item : frame.items) {
    items.push_back(item_node(item));
  }

  return node::record({
      {"index", i(frame.index)},
      {"start", opt(frame.start,
                    [](const format::frame_start_info& start) {
                      return node::record({
                          {"random_seed", u(start.random_seed)},
                          {"scene_frame_counter", opt(start.scene_frame_counter, [](uint32_t v) { return u(v); })},
                      });
                    })},
      {"ports", node::sequence(std::move(ports))},
      {"items", node::sequence(std::move(items))},
      {"end", opt(frame.end,
                  [](const format::frame_bookend_info& end) {
                    return node::record({
                        {"latest_finalized_frame", opt(end.latest_finalized_frame, [](int32_t v) { return i(v); })},
                    });
                  })},
  });
}

node frames_node(const game::replay& replay) {
  const auto* frames = &replay.frames;
  return node::lazy_sequence(frames->size(), [frames](size_t index) { return frame_node((*frames)[index]); });
}

node replay_node(const game::replay& replay, const view_options& options) {
  std::vector<node_field> fields;
  fields.push_back({"start", start_node(replay.start)});
  fields.push_back({"end", end_node(replay.end)});
  fields.push_back({"metadata", metadata_node(replay)});
  if (options.include_frames) {
    fields.push_back({"frames", frames_node(replay)});
  }
  return node::record(std::move(fields));
}

} // namespace slp::query

#include "event_codec.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

#include "slpbase/sjis.hpp"

namespace slp::format {

namespace {

constexpr format_version k_base{0, 1, 0};

constexpr size_t k_player_block_offset = 0x64;
constexpr size_t k_player_block_size = 0x24;
constexpr size_t k_ucf_offset = 0x140;
constexpr size_t k_name_tag_offset = 0x160;
constexpr size_t k_name_tag_size = 0x10;
constexpr size_t k_display_name_offset = 0x1A4;
constexpr size_t k_display_name_size = 0x1F;
constexpr size_t k_connect_code_offset = 0x220;
constexpr size_t k_connect_code_size = 0x0A;
constexpr size_t k_suid_offset = 0x248;
constexpr size_t k_suid_size = 0x1D;
constexpr size_t k_match_id_size = 0x33;

bool read_value(byte_reader& reader, uint8_t& value) { return reader.read_u8(value); }
bool read_value(byte_reader& reader, int8_t& value) { return reader.read_i8(value); }
bool read_value(byte_reader& reader, bool& value) { return reader.read_bool(value); }
bool read_value(byte_reader& reader, uint16_t& value) { return reader.read_u16(value); }
bool read_value(byte_reader& reader, uint32_t& value) { return reader.read_u32(value); }
bool read_value(byte_reader& reader, int32_t& value) { return reader.read_i32(value); }
bool read_value(byte_reader& reader, float& value) { return reader.read_f32(value); }

void write_value(byte_writer& writer, uint8_t value) { writer.write_u8(value); }
void write_value(byte_writer& writer, int8_t value) { writer.write_i8(value); }
void write_value(byte_writer& writer, bool value) { writer.write_bool(value); }
void write_value(byte_writer& writer, uint16_t value) { writer.write_u16(value); }
void write_value(byte_writer& writer, uint32_t value) { writer.write_u32(value); }
void write_value(byte_writer& writer, int32_t value) { writer.write_i32(value); }
void write_value(byte_writer& writer, float value) { writer.write_f32(value); }

template <typename T> bool read_optional(byte_reader& reader, std::optional<T>& out) {
  T value{};
  if (!read_value(reader, value)) {
    return false;
  }
  out = value;
  return true;
}

template <typename T> void write_optional(byte_writer& writer, const std::optional<T>& value) {
  write_value(writer, value.value_or(T{}));
}

bool read_point(byte_reader& reader, point& out) { return reader.read_f32(out.x) && reader.read_f32(out.y); }

bool read_text(byte_reader& reader, size_t size, std::string& out, bool fold = false) {
  std::span<const uint8_t> bytes;
  if (!reader.read_span(size, bytes)) {
    return false;
  }
  out = util::decode_shift_jis(bytes, fold);
  return true;
}

void write_text(byte_writer& writer, std::string_view text, size_t size) {
  writer.write_bytes(util::encode_shift_jis(text, size));
}

template <typename T>
status decode_with_rules(
    const std::vector<field_rule<T>>& rules, std::span<const uint8_t> payload, const format_version& version,
    const char* event_name, T& out
) {
  byte_reader reader(payload);
  for (const auto& rule : rules) {
    if (version < rule.since) {
      continue;
    }
    if (rule.offset + rule.size > payload.size()) {
      return make_status(
          error_code::malformed_event, std::string(event_name) + " payload too short for " + rule.name + " (needs " +
                                           std::to_string(rule.offset + rule.size) + " bytes, has " +
                                           std::to_string(payload.size()) + ")"
      );
    }
    if (!reader.seek(rule.offset) || !rule.decode(reader, out)) {
      return make_status(error_code::malformed_event, std::string(event_name) + " field " + rule.name + " unreadable");
    }
  }
  return ok_status();
}

template <typename T>
std::vector<uint8_t> encode_with_rules(const std::vector<field_rule<T>>& rules, const format_version& version, const T& in) {
  std::vector<uint8_t> out;
  byte_writer writer(out);
  for (const auto& rule : rules) {
    if (version < rule.since || !rule.encode) {
      continue;
    }
    writer.align_to(rule.offset);
    rule.encode(writer, in);
    writer.align_to(rule.offset + rule.size);
  }
  return out;
}

// Start decodes into all four slots; inactive slots are dropped afterwards.
struct start_layout {
  game_start start;
  std::array<player_config, k_port_count> slots{};
};

bool read_player_blocks(byte_reader& reader, start_layout& out) {
  for (size_t i = 0; i < k_port_count; ++i) {
    auto& slot = out.slots[i];
    const size_t base = k_player_block_offset + k_player_block_size * i;
    slot.port = static_cast<uint8_t>(i);
    bool ok = reader.seek(base) && reader.read_u8(slot.character) && reader.read_u8(slot.type) &&
              reader.read_u8(slot.stocks) && reader.read_u8(slot.costume);
    ok = ok && reader.seek(base + 0x07) && reader.read_u8(slot.team_shade) && reader.read_u8(slot.handicap) &&
         reader.read_u8(slot.team_id);
    ok = ok && reader.seek(base + 0x0C) && reader.read_u8(slot.bitfield);
    ok = ok && reader.seek(base + 0x0F) && reader.read_u8(slot.cpu_level);
    ok = ok && reader.seek(base + 0x18) && reader.read_f32(slot.offense_ratio) && reader.read_f32(slot.defense_ratio) &&
         reader.read_f32(slot.model_scale);
    if (!ok) {
      return false;
    }
  }
  return true;
}

void write_player_blocks(byte_writer& writer, const start_layout& in) {
  for (size_t i = 0; i < k_port_count; ++i) {
    const auto& slot = in.slots[i];
    const size_t base = k_player_block_offset + k_player_block_size * i;
    writer.align_to(base);
    writer.write_u8(slot.character);
    writer.write_u8(slot.type);
    writer.write_u8(slot.stocks);
    writer.write_u8(slot.costume);
    writer.align_to(base + 0x07);
    writer.write_u8(slot.team_shade);
    writer.write_u8(slot.handicap);
    writer.write_u8(slot.team_id);
    writer.align_to(base + 0x0C);
    writer.write_u8(slot.bitfield);
    writer.align_to(base + 0x0F);
    writer.write_u8(slot.cpu_level);
    writer.align_to(base + 0x18);
    writer.write_f32(slot.offense_ratio);
    writer.write_f32(slot.defense_ratio);
    writer.write_f32(slot.model_scale);
  }
}

netplay_identity& ensure_netplay(player_config& slot) {
  if (!slot.netplay) {
    slot.netplay.emplace();
  }
  return *slot.netplay;
}

const std::vector<field_rule<start_layout>>& game_start_rules() {
  using R = byte_reader;
  using W = byte_writer;
  using L = start_layout;
  static const std::vector<field_rule<L>> rules = {
      {"version", k_base, 0x00, 4,
       [](R& r, L& o) {
         uint8_t unused = 0;
         return r.read_u8(o.start.slippi.major) && r.read_u8(o.start.slippi.minor) &&
                r.read_u8(o.start.slippi.revision) && r.read_u8(unused);
       },
       [](W& w, const L& i) {
         w.write_u8(i.start.slippi.major);
         w.write_u8(i.start.slippi.minor);
         w.write_u8(i.start.slippi.revision);
         w.write_u8(0);
       }},
      {"bitfield", k_base, 0x04, 4, [](R& r, L& o) { return r.read_array(o.start.bitfield); },
       [](W& w, const L& i) { w.write_bytes(i.start.bitfield); }},
      {"is_raining_bombs", k_base, 0x0A, 1, [](R& r, L& o) { return r.read_bool(o.start.is_raining_bombs); },
       [](W& w, const L& i) { w.write_bool(i.start.is_raining_bombs); }},
      {"is_teams", k_base, 0x0C, 1, [](R& r, L& o) { return r.read_bool(o.start.is_teams); },
       [](W& w, const L& i) { w.write_bool(i.start.is_teams); }},
      {"item_spawn_frequency", k_base, 0x0F, 1, [](R& r, L& o) { return r.read_i8(o.start.item_spawn_frequency); },
       [](W& w, const L& i) { w.write_i8(i.start.item_spawn_frequency); }},
      {"self_destruct_score", k_base, 0x10, 1, [](R& r, L& o) { return r.read_i8(o.start.self_destruct_score); },
       [](W& w, const L& i) { w.write_i8(i.start.self_destruct_score); }},
      {"stage", k_base, 0x12, 2, [](R& r, L& o) { return r.read_u16(o.start.stage); },
       [](W& w, const L& i) { w.write_u16(i.start.stage); }},
      {"timer", k_base, 0x14, 4, [](R& r, L& o) { return r.read_u32(o.start.timer); },
       [](W& w, const L& i) { w.write_u32(i.start.timer); }},
      {"item_spawn_bitfield", k_base, 0x27, 5, [](R& r, L& o) { return r.read_array(o.start.item_spawn_bitfield); },
       [](W& w, const L& i) { w.write_bytes(i.start.item_spawn_bitfield); }},
      {"damage_ratio", k_base, 0x34, 4, [](R& r, L& o) { return r.read_f32(o.start.damage_ratio); },
       [](W& w, const L& i) { w.write_f32(i.start.damage_ratio); }},
      {"players", k_base, k_player_block_offset, k_player_block_size * k_port_count, read_player_blocks,
       write_player_blocks},
      {"random_seed", k_base, 0x13C, 4, [](R& r, L& o) { return r.read_u32(o.start.random_seed); },
       [](W& w, const L& i) { w.write_u32(i.start.random_seed); }},
      {"ucf", {1, 0, 0}, k_ucf_offset, 8 * k_port_count,
       [](R& r, L& o) {
         for (auto& slot : o.slots) {
           ucf_settings ucf;
           if (!r.read_u32(ucf.dash_back) || !r.read_u32(ucf.shield_drop)) {
             return false;
           }
           slot.ucf = ucf;
         }
         return true;
       },
       [](W& w, const L& i) {
         for (const auto& slot : i.slots) {
           const auto ucf = slot.ucf.value_or(ucf_settings{});
           w.write_u32(ucf.dash_back);
           w.write_u32(ucf.shield_drop);
         }
       }},
      {"name_tags", {1, 3, 0}, k_name_tag_offset, k_name_tag_size * k_port_count,
       [](R& r, L& o) {
         for (auto& slot : o.slots) {
           std::string tag;
           if (!read_text(r, k_name_tag_size, tag)) {
             return false;
           }
           slot.name_tag = std::move(tag);
         }
         return true;
       },
       [](W& w, const L& i) {
         for (const auto& slot : i.slots) {
           write_text(w, slot.name_tag.value_or(""), k_name_tag_size);
         }
       }},
      {"is_pal", {1, 5, 0}, 0x1A0, 1, [](R& r, L& o) { return read_optional(r, o.start.is_pal); },
       [](W& w, const L& i) { write_optional(w, i.start.is_pal); }},
      {"is_frozen_ps", {2, 0, 0}, 0x1A1, 1, [](R& r, L& o) { return read_optional(r, o.start.is_frozen_ps); },
       [](W& w, const L& i) { write_optional(w, i.start.is_frozen_ps); }},
      {"scene", {3, 7, 0}, 0x1A2, 2,
       [](R& r, L& o) {
         scene_info scene;
         if (!r.read_u8(scene.minor) || !r.read_u8(scene.major)) {
           return false;
         }
         o.start.scene = scene;
         return true;
       },
       [](W& w, const L& i) {
         const auto scene = i.start.scene.value_or(scene_info{});
         w.write_u8(scene.minor);
         w.write_u8(scene.major);
       }},
      {"display_names", {3, 9, 0}, k_display_name_offset, k_display_name_size * k_port_count,
       [](R& r, L& o) {
         for (auto& slot : o.slots) {
           if (!read_text(r, k_display_name_size, ensure_netplay(slot).name)) {
             return false;
           }
         }
         return true;
       },
       [](W& w, const L& i) {
         for (const auto& slot : i.slots) {
           write_text(w, slot.netplay ? slot.netplay->name : "", k_display_name_size);
         }
       }},
      {"connect_codes", {3, 9, 0}, k_connect_code_offset, k_connect_code_size * k_port_count,
       [](R& r, L& o) {
         for (auto& slot : o.slots) {
           if (!read_text(r, k_connect_code_size, ensure_netplay(slot).code, true)) {
             return false;
           }
         }
         return true;
       },
       [](W& w, const L& i) {
         for (const auto& slot : i.slots) {
           write_text(w, slot.netplay ? slot.netplay->code : "", k_connect_code_size);
         }
       }},
      {"suids", {3, 11, 0}, k_suid_offset, k_suid_size * k_port_count,
       [](R& r, L& o) {
         for (auto& slot : o.slots) {
           std::string suid;
           if (!read_text(r, k_suid_size, suid)) {
             return false;
           }
           ensure_netplay(slot).suid = std::move(suid);
         }
         return true;
       },
       [](W& w, const L& i) {
         for (const auto& slot : i.slots) {
           const bool has = slot.netplay && slot.netplay->suid;
           write_text(w, has ? *slot.netplay->suid : "", k_suid_size);
         }
       }},
      {"language", {3, 12, 0}, 0x2BC, 1, [](R& r, L& o) { return read_optional(r, o.start.language); },
       [](W& w, const L& i) { write_optional(w, i.start.language); }},
      {"match", {3, 14, 0}, 0x2BD, k_match_id_size + 8,
       [](R& r, L& o) {
         match_info match;
         if (!read_text(r, k_match_id_size, match.id) || !r.read_u32(match.game_number) ||
             !r.read_u32(match.tiebreaker_number)) {
           return false;
         }
         o.start.match = std::move(match);
         return true;
       },
       [](W& w, const L& i) {
         const auto match = i.start.match.value_or(match_info{});
         write_text(w, match.id, k_match_id_size);
         w.write_u32(match.game_number);
         w.write_u32(match.tiebreaker_number);
       }},
  };
  return rules;
}

const std::vector<field_rule<game_end>>& game_end_rules() {
  using R = byte_reader;
  using W = byte_writer;
  static const std::vector<field_rule<game_end>> rules = {
      {"method", k_base, 0x00, 1, [](R& r, game_end& o) { return r.read_u8(o.method); },
       [](W& w, const game_end& i) { w.write_u8(i.method); }},
      {"lras_initiator", {2, 0, 0}, 0x01, 1, [](R& r, game_end& o) { return read_optional(r, o.lras_initiator); },
       [](W& w, const game_end& i) { w.write_i8(i.lras_initiator.value_or(-1)); }},
      {"placements", {3, 13, 0}, 0x02, 4,
       [](R& r, game_end& o) {
         std::array<uint8_t, 4> raw{};
         if (!r.read_array(raw)) {
           return false;
         }
         std::array<int8_t, 4> placements{};
         std::transform(raw.begin(), raw.end(), placements.begin(), [](uint8_t v) { return static_cast<int8_t>(v); });
         o.placements = placements;
         return true;
       },
       [](W& w, const game_end& i) {
         const auto placements = i.placements.value_or(std::array<int8_t, 4>{-1, -1, -1, -1});
         for (int8_t place : placements) {
           w.write_i8(place);
         }
       }},
  };
  return rules;
}

const std::vector<field_rule<pre_frame_event>>& pre_frame_rules() {
  using R = byte_reader;
  using E = pre_frame_event;
  static const std::vector<field_rule<E>> rules = {
      {"frame", k_base, 0x00, 4, [](R& r, E& o) { return r.read_i32(o.frame); }},
      {"port", k_base, 0x04, 1, [](R& r, E& o) { return r.read_u8(o.port); }},
      {"is_follower", k_base, 0x05, 1, [](R& r, E& o) { return r.read_bool(o.is_follower); }},
      {"random_seed", k_base, 0x06, 4, [](R& r, E& o) { return r.read_u32(o.data.random_seed); }},
      {"state", k_base, 0x0A, 2, [](R& r, E& o) { return r.read_u16(o.data.state); }},
      {"position", k_base, 0x0C, 8, [](R& r, E& o) { return read_point(r, o.data.position); }},
      {"direction", k_base, 0x14, 4, [](R& r, E& o) { return r.read_f32(o.data.direction); }},
      {"joystick", k_base, 0x18, 8, [](R& r, E& o) { return read_point(r, o.data.joystick); }},
      {"cstick", k_base, 0x20, 8, [](R& r, E& o) { return read_point(r, o.data.cstick); }},
      {"trigger", k_base, 0x28, 4, [](R& r, E& o) { return r.read_f32(o.data.trigger.logical); }},
      {"buttons", k_base, 0x2C, 6,
       [](R& r, E& o) { return r.read_u32(o.data.button.logical) && r.read_u16(o.data.button.physical); }},
      {"physical_triggers", k_base, 0x32, 8,
       [](R& r, E& o) { return r.read_f32(o.data.trigger.physical.l) && r.read_f32(o.data.trigger.physical.r); }},
      {"raw_analog_x", {1, 2, 0}, 0x3A, 1, [](R& r, E& o) { return read_optional(r, o.data.raw_analog_x); }},
      {"damage", {1, 4, 0}, 0x3B, 4, [](R& r, E& o) { return read_optional(r, o.data.damage); }},
      {"raw_analog_y", {3, 15, 0}, 0x3F, 1, [](R& r, E& o) { return read_optional(r, o.data.raw_analog_y); }},
  };
  return rules;
}

const std::vector<field_rule<post_frame_event>>& post_frame_rules() {
  using R = byte_reader;
  using E = post_frame_event;
  static const std::vector<field_rule<E>> rules = {
      {"frame", k_base, 0x00, 4, [](R& r, E& o) { return r.read_i32(o.frame); }},
      {"port", k_base, 0x04, 1, [](R& r, E& o) { return r.read_u8(o.port); }},
      {"is_follower", k_base, 0x05, 1, [](R& r, E& o) { return r.read_bool(o.is_follower); }},
      {"character", k_base, 0x06, 1, [](R& r, E& o) { return r.read_u8(o.data.character); }},
      {"state", k_base, 0x07, 2, [](R& r, E& o) { return r.read_u16(o.data.state); }},
      {"position", k_base, 0x09, 8, [](R& r, E& o) { return read_point(r, o.data.position); }},
      {"direction", k_base, 0x11, 4, [](R& r, E& o) { return r.read_f32(o.data.direction); }},
      {"damage", k_base, 0x15, 4, [](R& r, E& o) { return r.read_f32(o.data.damage); }},
      {"shield", k_base, 0x19, 4, [](R& r, E& o) { return r.read_f32(o.data.shield); }},
      {"last_attack_landed", k_base, 0x1D, 1, [](R& r, E& o) { return r.read_u8(o.data.last_attack_landed); }},
      {"combo_count", k_base, 0x1E, 1, [](R& r, E& o) { return r.read_u8(o.data.combo_count); }},
      {"last_hit_by", k_base, 0x1F, 1, [](R& r, E& o) { return r.read_u8(o.data.last_hit_by); }},
      {"stocks", k_base, 0x20, 1, [](R& r, E& o) { return r.read_u8(o.data.stocks); }},
      {"state_age", {0, 2, 0}, 0x21, 4, [](R& r, E& o) { return read_optional(r, o.data.state_age); }},
      {"flags", {2, 0, 0}, 0x25, 5,
       [](R& r, E& o) {
         uint64_t flags = 0;
         if (!r.read_u40(flags)) {
           return false;
         }
         o.data.flags = flags;
         return true;
       }},
      {"misc_as", {2, 0, 0}, 0x2A, 4, [](R& r, E& o) { return read_optional(r, o.data.misc_as); }},
      {"airborne", {2, 0, 0}, 0x2E, 1, [](R& r, E& o) { return read_optional(r, o.data.airborne); }},
      {"ground", {2, 0, 0}, 0x2F, 2, [](R& r, E& o) { return read_optional(r, o.data.ground); }},
      {"jumps", {2, 0, 0}, 0x31, 1, [](R& r, E& o) { return read_optional(r, o.data.jumps); }},
      {"l_cancel", {2, 0, 0}, 0x32, 1, [](R& r, E& o) { return read_optional(r, o.data.l_cancel); }},
      {"hurtbox_state", {2, 1, 0}, 0x33, 1, [](R& r, E& o) { return read_optional(r, o.data.hurtbox_state); }},
      {"velocities", {3, 5, 0}, 0x34, 20,
       [](R& r, E& o) {
         velocities v;
         if (!r.read_f32(v.self_x_air) || !r.read_f32(v.self_y) || !r.read_f32(v.knockback_x) ||
             !r.read_f32(v.knockback_y) || !r.read_f32(v.self_x_ground)) {
           return false;
         }
         o.data.velocity = v;
         return true;
       }},
      {"hitlag", {3, 8, 0}, 0x48, 4, [](R& r, E& o) { return read_optional(r, o.data.hitlag); }},
      {"animation_index", {3, 11, 0}, 0x4C, 4, [](R& r, E& o) { return read_optional(r, o.data.animation_index); }},
  };
  return rules;
}

const std::vector<field_rule<item_event>>& item_rules() {
  using R = byte_reader;
  using E = item_event;
  static const std::vector<field_rule<E>> rules = {
      {"frame", k_base, 0x00, 4, [](R& r, E& o) { return r.read_i32(o.frame); }},
      {"type", k_base, 0x04, 2, [](R& r, E& o) { return r.read_u16(o.data.type); }},
      {"state", k_base, 0x06, 1, [](R& r, E& o) { return r.read_u8(o.data.state); }},
      {"direction", k_base, 0x07, 4, [](R& r, E& o) { return r.read_f32(o.data.direction); }},
      {"velocity", k_base, 0x0B, 8, [](R& r, E& o) { return read_point(r, o.data.velocity); }},
      {"position", k_base, 0x13, 8, [](R& r, E& o) { return read_point(r, o.data.position); }},
      {"damage", k_base, 0x1B, 2, [](R& r, E& o) { return r.read_u16(o.data.damage); }},
      {"timer", k_base, 0x1D, 4, [](R& r, E& o) { return r.read_f32(o.data.timer); }},
      {"id", k_base, 0x21, 4, [](R& r, E& o) { return r.read_u32(o.data.id); }},
      {"misc", {3, 2, 0}, 0x25, 4,
       [](R& r, E& o) {
         std::array<uint8_t, 4> misc{};
         if (!r.read_array(misc)) {
           return false;
         }
         o.data.misc = misc;
         return true;
       }},
      {"owner", {3, 6, 0}, 0x29, 1, [](R& r, E& o) { return read_optional(r, o.data.owner); }},
  };
  return rules;
}

const std::vector<field_rule<frame_start_event>>& frame_start_rules() {
  using R = byte_reader;
  using E = frame_start_event;
  static const std::vector<field_rule<E>> rules = {
      {"frame", k_base, 0x00, 4, [](R& r, E& o) { return r.read_i32(o.frame); }},
      {"random_seed", k_base, 0x04, 4, [](R& r, E& o) { return r.read_u32(o.data.random_seed); }},
      {"scene_frame_counter", {3, 10, 0}, 0x08, 4,
       [](R& r, E& o) { return read_optional(r, o.data.scene_frame_counter); }},
  };
  return rules;
}

const std::vector<field_rule<frame_bookend_event>>& frame_bookend_rules() {
  using R = byte_reader;
  using E = frame_bookend_event;
  static const std::vector<field_rule<E>> rules = {
      {"frame", k_base, 0x00, 4, [](R& r, E& o) { return r.read_i32(o.frame); }},
      {"latest_finalized_frame", {3, 7, 0}, 0x04, 4,
       [](R& r, E& o) { return read_optional(r, o.data.latest_finalized_frame); }},
  };
  return rules;
}

status decode_message_splitter(std::span<const uint8_t> payload, message_splitter_event& out) {
  if (payload.size() < k_message_splitter_payload_size) {
    return make_status(
        error_code::malformed_event,
        "message splitter payload too short (" + std::to_string(payload.size()) + " bytes)"
    );
  }
  byte_reader reader(payload);
  uint16_t actual_size = 0;
  if (!reader.seek(k_message_splitter_data_size) || !reader.read_u16(actual_size) ||
      !reader.read_u8(out.internal_command) || !reader.read_bool(out.last_message)) {
    return make_status(error_code::malformed_event, "message splitter trailer unreadable");
  }
  if (actual_size > k_message_splitter_data_size) {
    return make_status(
        error_code::malformed_event, "message splitter fragment size " + std::to_string(actual_size) + " exceeds 512"
    );
  }
  out.data.assign(payload.begin(), payload.begin() + actual_size);
  return ok_status();
}

template <typename T, typename Rules>
status decode_into(const Rules& rules, std::span<const uint8_t> payload, const format_version& version,
                   const char* name, decoded_event& out) {
  T event{};
  auto st = decode_with_rules(rules, payload, version, name, event);
  if (!st.ok()) {
    return st;
  }
  out = std::move(event);
  return ok_status();
}

} // namespace

const char* event_code_name(uint8_t code) {
  switch (static_cast<event_code>(code)) {
  case event_code::message_splitter:
    return "message_splitter";
  case event_code::event_payloads:
    return "event_payloads";
  case event_code::game_start:
    return "game_start";
  case event_code::pre_frame:
    return "pre_frame";
  case event_code::post_frame:
    return "post_frame";
  case event_code::game_end:
    return "game_end";
  case event_code::frame_start:
    return "frame_start";
  case event_code::item:
    return "item";
  case event_code::frame_bookend:
    return "frame_bookend";
  case event_code::gecko_list:
    return "gecko_list";
  }
  return "unknown";
}

bool is_decodable_event(uint8_t code) {
  switch (static_cast<event_code>(code)) {
  case event_code::message_splitter:
  case event_code::game_start:
  case event_code::pre_frame:
  case event_code::post_frame:
  case event_code::game_end:
  case event_code::frame_start:
  case event_code::item:
  case event_code::frame_bookend:
  case event_code::gecko_list:
    return true;
  case event_code::event_payloads:
    return false;
  }
  return false;
}

status decode_game_start(std::span<const uint8_t> payload, game_start& out) {
  if (payload.size() < 4) {
    return make_status(error_code::malformed_event, "game_start payload too short for version");
  }
  const format_version version{payload[0], payload[1], payload[2]};
  start_layout layout;
  auto st = decode_with_rules(game_start_rules(), payload, version, "game_start", layout);
  if (!st.ok()) {
    return st;
  }
  for (auto& slot : layout.slots) {
    if (slot.type != k_player_type_empty) {
      layout.start.players.push_back(std::move(slot));
    }
  }
  out = std::move(layout.start);
  return ok_status();
}

status decode_game_end(std::span<const uint8_t> payload, const format_version& version, game_end& out) {
  game_end end;
  auto st = decode_with_rules(game_end_rules(), payload, version, "game_end", end);
  if (!st.ok()) {
    return st;
  }
  out = end;
  return ok_status();
}

status decode_event(uint8_t code, std::span<const uint8_t> payload, const format_version& version, decoded_event& out) {
  switch (static_cast<event_code>(code)) {
  case event_code::game_start: {
    game_start_event event;
    auto st = decode_game_start(payload, event.data);
    if (!st.ok()) {
      return st;
    }
    event.raw.assign(payload.begin(), payload.end());
    out = std::move(event);
    return ok_status();
  }
  case event_code::game_end: {
    game_end_event event;
    auto st = decode_game_end(payload, version, event.data);
    if (!st.ok()) {
      return st;
    }
    event.raw.assign(payload.begin(), payload.end());
    out = std::move(event);
    return ok_status();
  }
  case event_code::pre_frame:
    return decode_into<pre_frame_event>(pre_frame_rules(), payload, version, "pre_frame", out);
  case event_code::post_frame:
    return decode_into<post_frame_event>(post_frame_rules(), payload, version, "post_frame", out);
  case event_code::item:
    return decode_into<item_event>(item_rules(), payload, version, "item", out);
  case event_code::frame_start:
    return decode_into<frame_start_event>(frame_start_rules(), payload, version, "frame_start", out);
  case event_code::frame_bookend:
    return decode_into<frame_bookend_event>(frame_bookend_rules(), payload, version, "frame_bookend", out);
  case event_code::message_splitter: {
    message_splitter_event event;
    auto st = decode_message_splitter(payload, event);
    if (!st.ok()) {
      return st;
    }
    out = std::move(event);
    return ok_status();
  }
  case event_code::gecko_list:
    out = gecko_list_event{std::vector<uint8_t>(payload.begin(), payload.end())};
    return ok_status();
  case event_code::event_payloads:
    break;
  }
  return make_status(error_code::unknown_event_code, std::string("no decoder for event ") + event_code_name(code));
}

std::vector<uint8_t> encode_game_start(const game_start& start) {
  start_layout layout;
  layout.start = start;
  layout.start.players.clear();
  for (size_t i = 0; i < k_port_count; ++i) {
    layout.slots[i].port = static_cast<uint8_t>(i);
  }
  for (const auto& player : start.players) {
    if (player.port < k_port_count) {
      layout.slots[player.port] = player;
    }
  }
  return encode_with_rules(game_start_rules(), start.slippi, layout);
}

std::vector<uint8_t> encode_game_end(const game_end& end, const format_version& version) {
  return encode_with_rules(game_end_rules(), version, end);
}

} // namespace slp::format

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace slp::format {

struct format_version {
  uint8_t major = 0;
  uint8_t minor = 0;
  uint8_t revision = 0;

  std::string to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(revision);
  }
};

inline bool operator<(const format_version& lhs, const format_version& rhs) {
  return std::tie(lhs.major, lhs.minor, lhs.revision) < std::tie(rhs.major, rhs.minor, rhs.revision);
}
inline bool operator==(const format_version& lhs, const format_version& rhs) {
  return std::tie(lhs.major, lhs.minor, lhs.revision) == std::tie(rhs.major, rhs.minor, rhs.revision);
}
inline bool operator!=(const format_version& lhs, const format_version& rhs) { return !(lhs == rhs); }
inline bool operator>=(const format_version& lhs, const format_version& rhs) { return !(lhs < rhs); }

// newest layout this decoder knows every field of
constexpr format_version k_latest_version{3, 16, 0};

enum class event_code : uint8_t {
  message_splitter = 0x10,
  event_payloads = 0x35,
  game_start = 0x36,
  pre_frame = 0x37,
  post_frame = 0x38,
  game_end = 0x39,
  frame_start = 0x3A,
  item = 0x3B,
  frame_bookend = 0x3C,
  gecko_list = 0x3D,
};

const char* event_code_name(uint8_t code);

constexpr int32_t k_first_frame_index = -123;
constexpr size_t k_port_count = 4;
constexpr uint8_t k_player_type_empty = 3;
constexpr size_t k_message_splitter_data_size = 512;
constexpr size_t k_message_splitter_payload_size = 516;

struct point {
  float x = 0;
  float y = 0;
};

struct physical_triggers {
  float l = 0;
  float r = 0;
};

struct triggers {
  float logical = 0;
  physical_triggers physical;
};

struct buttons {
  uint32_t logical = 0;
  uint16_t physical = 0;
};

struct velocities {
  float self_x_air = 0;
  float self_y = 0;
  float knockback_x = 0;
  float knockback_y = 0;
  float self_x_ground = 0;
};

struct ucf_settings {
  uint32_t dash_back = 0;
  uint32_t shield_drop = 0;
};

struct netplay_identity {
  std::string name;
  std::string code;
  std::optional<std::string> suid; // v3.11
};

struct player_config {
  uint8_t port = 0; // zero-based slot
  uint8_t character = 0; // external character id
  uint8_t type = k_player_type_empty;
  uint8_t stocks = 0;
  uint8_t costume = 0;
  uint8_t team_shade = 0;
  uint8_t handicap = 0;
  uint8_t team_id = 0;
  uint8_t bitfield = 0;
  uint8_t cpu_level = 0;
  float offense_ratio = 0;
  float defense_ratio = 0;
  float model_scale = 0;
  std::optional<ucf_settings> ucf; // v1.0
  std::optional<std::string> name_tag; // v1.3
  std::optional<netplay_identity> netplay; // v3.9
};

struct scene_info {
  uint8_t minor = 0;
  uint8_t major = 0;
};

struct match_info {
  std::string id;
  uint32_t game_number = 0;
  uint32_t tiebreaker_number = 0;
};

struct game_start {
  format_version slippi;
  std::array<uint8_t, 4> bitfield{};
  bool is_raining_bombs = false;
  bool is_teams = false;
  int8_t item_spawn_frequency = 0;
  int8_t self_destruct_score = 0;
  uint16_t stage = 0;
  uint32_t timer = 0;
  std::array<uint8_t, 5> item_spawn_bitfield{};
  float damage_ratio = 0;
  std::vector<player_config> players; // active ports only, ascending
  uint32_t random_seed = 0;
  std::optional<bool> is_pal; // v1.5
  std::optional<bool> is_frozen_ps; // v2.0
  std::optional<scene_info> scene; // v3.7
  std::optional<uint8_t> language; // v3.12
  std::optional<match_info> match; // v3.14
};

struct pre_frame {
  uint32_t random_seed = 0;
  uint16_t state = 0;
  point position;
  float direction = 0;
  point joystick;
  point cstick;
  triggers trigger;
  buttons button;
  std::optional<int8_t> raw_analog_x; // v1.2
  std::optional<float> damage; // v1.4
  std::optional<int8_t> raw_analog_y; // v3.15
};

struct post_frame {
  uint8_t character = 0; // internal character id
  uint16_t state = 0;
  point position;
  float direction = 0;
  float damage = 0;
  float shield = 0;
  uint8_t last_attack_landed = 0;
  uint8_t combo_count = 0;
  uint8_t last_hit_by = 0;
  uint8_t stocks = 0;
  std::optional<float> state_age; // v0.2
  std::optional<uint64_t> flags; // v2.0, 40 bits
  std::optional<float> misc_as; // v2.0
  std::optional<bool> airborne; // v2.0
  std::optional<uint16_t> ground; // v2.0
  std::optional<uint8_t> jumps; // v2.0
  std::optional<uint8_t> l_cancel; // v2.0
  std::optional<uint8_t> hurtbox_state; // v2.1
  std::optional<velocities> velocity; // v3.5
  std::optional<float> hitlag; // v3.8
  std::optional<uint32_t> animation_index; // v3.11
};

struct item_state {
  uint16_t type = 0;
  uint8_t state = 0;
  float direction = 0;
  point velocity;
  point position;
  uint16_t damage = 0;
  float timer = 0;
  uint32_t id = 0;
  std::optional<std::array<uint8_t, 4>> misc; // v3.2
  std::optional<int8_t> owner; // v3.6
};

struct frame_start_info {
  uint32_t random_seed = 0;
  std::optional<uint32_t> scene_frame_counter; // v3.10
};

struct frame_bookend_info {
  std::optional<int32_t> latest_finalized_frame; // v3.7
};

struct game_end {
  uint8_t method = 0;
  std::optional<int8_t> lras_initiator; // v2.0, -1 when nobody quit
  std::optional<std::array<int8_t, 4>> placements; // v3.13
};

struct game_start_event {
  game_start data;
  std::vector<uint8_t> raw;
};

struct pre_frame_event {
  int32_t frame = 0;
  uint8_t port = 0;
  bool is_follower = false;
  pre_frame data;
};

struct post_frame_event {
  int32_t frame = 0;
  uint8_t port = 0;
  bool is_follower = false;
  post_frame data;
};

struct item_event {
  int32_t frame = 0;
  item_state data;
};

struct frame_start_event {
  int32_t frame = 0;
  frame_start_info data;
};

struct frame_bookend_event {
  int32_t frame = 0;
  frame_bookend_info data;
};

struct game_end_event {
  game_end data;
  std::vector<uint8_t> raw;
};

struct message_splitter_event {
  std::vector<uint8_t> data; // actual bytes of this fragment
  uint8_t internal_command = 0;
  bool last_message = false;
};

struct gecko_list_event {
  std::vector<uint8_t> codes;
};

using decoded_event = std::variant<
    game_start_event, pre_frame_event, post_frame_event, item_event, frame_start_event, frame_bookend_event,
    game_end_event, message_splitter_event, gecko_list_event>;

} // namespace slp::format

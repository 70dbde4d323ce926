#include "json_encoder.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace slp::io {

namespace {

using json = nlohmann::ordered_json;

const game::label_table& labels_for(const json_options& options) {
  return options.labels ? *options.labels : game::builtin_labels();
}

// accepts 14, "14:WAIT" and port names like "P2"
uint64_t code_of(const json& value) {
  if (!value.is_string()) {
    return value.get<uint64_t>();
  }
  std::string_view text = value.get_ref<const std::string&>();
  uint64_t offset = 0;
  if (!text.empty() && text.front() == 'P') {
    text.remove_prefix(1);
    offset = 1;
  }
  uint64_t code = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), code);
  if (ec != std::errc{} || ptr == text.data() || (ptr != text.data() + text.size() && *ptr != ':')) {
    throw std::invalid_argument("expected a numeric code, got '" + value.get<std::string>() + "'");
  }
  return code - offset;
}

template <typename T> T read_code(const json& object, const char* key) { return static_cast<T>(code_of(object.at(key))); }

template <typename T> T read_number(const json& object, const char* key) { return object.at(key).get<T>(); }

float read_float(const json& object, const char* key) { return static_cast<float>(object.at(key).get<double>()); }

template <size_t N, typename T> std::array<T, N> read_array(const json& value) {
  std::array<T, N> out{};
  if (value.size() != N) {
    throw std::invalid_argument("expected " + std::to_string(N) + " elements");
  }
  for (size_t i = 0; i < N; ++i) {
    out[i] = value.at(i).get<T>();
  }
  return out;
}

template <typename T, typename Read> std::optional<T> read_optional(const json& object, const char* key, Read read) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  return read(*it);
}

format::player_config player_from_json(const json& value) {
  format::player_config player;
  player.port = read_code<uint8_t>(value, "port");
  player.character = read_code<uint8_t>(value, "character");
  player.type = read_code<uint8_t>(value, "type");
  player.stocks = read_number<uint8_t>(value, "stocks");
  player.costume = read_number<uint8_t>(value, "costume");
  player.team_shade = read_number<uint8_t>(value, "team_shade");
  player.handicap = read_number<uint8_t>(value, "handicap");
  player.team_id = read_number<uint8_t>(value, "team_id");
  player.bitfield = read_number<uint8_t>(value, "bitfield");
  player.cpu_level = read_number<uint8_t>(value, "cpu_level");
  player.offense_ratio = read_float(value, "offense_ratio");
  player.defense_ratio = read_float(value, "defense_ratio");
  player.model_scale = read_float(value, "model_scale");
  player.ucf = read_optional<format::ucf_settings>(value, "ucf", [](const json& ucf) {
    return format::ucf_settings{read_number<uint32_t>(ucf, "dash_back"), read_number<uint32_t>(ucf, "shield_drop")};
  });
  player.name_tag = read_optional<std::string>(value, "name_tag", [](const json& tag) { return tag.get<std::string>(); });
  player.netplay = read_optional<format::netplay_identity>(value, "netplay", [](const json& netplay) {
    format::netplay_identity identity;
    identity.name = netplay.at("name").get<std::string>();
    identity.code = netplay.at("code").get<std::string>();
    identity.suid = read_optional<std::string>(netplay, "suid", [](const json& suid) { return suid.get<std::string>(); });
    return identity;
  });
  return player;
}

} // namespace

json to_json(const query::node& value, const json_options& options) {
  switch (value.kind()) {
  case query::node_kind::null:
    return nullptr;
  case query::node_kind::boolean:
    return value.as_bool();
  case query::node_kind::integer:
    if (options.annotate && value.label() && value.as_int() >= 0) {
      return game::annotate(labels_for(options), *value.label(), static_cast<uint32_t>(value.as_int()));
    }
    return value.as_int();
  case query::node_kind::unsigned_integer:
    if (options.annotate && value.label()) {
      return game::annotate(labels_for(options), *value.label(), static_cast<uint32_t>(value.as_uint()));
    }
    return value.as_uint();
  case query::node_kind::floating:
    return value.as_double();
  case query::node_kind::string:
    return value.as_string();
  case query::node_kind::sequence: {
    json out = json::array();
    for (size_t i = 0; i < value.size(); ++i) {
      out.push_back(to_json(value.at(i), options));
    }
    return out;
  }
  case query::node_kind::record: {
    json out = json::object();
    for (const auto& field : value.fields()) {
      out[field.name] = to_json(field.value, options);
    }
    return out;
  }
  }
  return nullptr;
}

std::string dump_json(const json& value, int indent) {
  return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string dump_json(const query::node& value, const json_options& options) {
  return dump_json(to_json(value, options), options.indent);
}

json query_results_json(const std::vector<query::query_result>& results, bool quiet, const json_options& options) {
  if (quiet) {
    json out = json::array();
    for (const auto& entry : results) {
      out.push_back(to_json(query::unwrap_singletons(entry.value), options));
    }
    return out.size() == 1 ? out.at(0) : out;
  }
  json out = json::object();
  for (const auto& entry : results) {
    out[entry.query] = to_json(entry.value, options);
  }
  return out;
}

status game_start_from_json(const json& value, format::game_start& out) {
  try {
    format::game_start start;
    const auto version = read_array<3, uint8_t>(value.at("version"));
    start.slippi = {version[0], version[1], version[2]};
    start.bitfield = read_array<4, uint8_t>(value.at("bitfield"));
    start.is_raining_bombs = value.at("is_raining_bombs").get<bool>();
    start.is_teams = value.at("is_teams").get<bool>();
    start.item_spawn_frequency = read_number<int8_t>(value, "item_spawn_frequency");
    start.self_destruct_score = read_number<int8_t>(value, "self_destruct_score");
    start.stage = read_code<uint16_t>(value, "stage");
    start.timer = read_number<uint32_t>(value, "timer");
    start.item_spawn_bitfield = read_array<5, uint8_t>(value.at("item_spawn_bitfield"));
    start.damage_ratio = read_float(value, "damage_ratio");
    for (const auto& player : value.at("players")) {
      start.players.push_back(player_from_json(player));
    }
    start.random_seed = read_number<uint32_t>(value, "random_seed");
    start.is_pal = read_optional<bool>(value, "is_pal", [](const json& v) { return v.get<bool>(); });
    start.is_frozen_ps = read_optional<bool>(value, "is_frozen_ps", [](const json& v) { return v.get<bool>(); });
    start.scene = read_optional<format::scene_info>(value, "scene", [](const json& v) {
      return format::scene_info{read_number<uint8_t>(v, "minor"), read_number<uint8_t>(v, "major")};
    });
    start.language = read_optional<uint8_t>(value, "language", [](const json& v) { return v.get<uint8_t>(); });
    start.match = read_optional<format::match_info>(value, "match", [](const json& v) {
      format::match_info match;
      match.id = v.at("id").get<std::string>();
      match.game_number = read_number<uint32_t>(v, "game_number");
      match.tiebreaker_number = read_number<uint32_t>(v, "tiebreaker_number");
      return match;
    });
    out = std::move(start);
    return ok_status();
  } catch (const std::exception& e) {
    return make_status(error_code::invalid_argument, std::string("start record JSON unreadable: ") + e.what());
  }
}

} // namespace slp::io

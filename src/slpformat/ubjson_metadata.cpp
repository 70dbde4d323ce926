#include "ubjson_metadata.hpp"

#include <charconv>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace slp::format {

namespace {

std::optional<uint32_t> parse_key_number(std::string_view key) {
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), value);
  if (ec != std::errc{} || ptr != key.data() + key.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> string_member(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

void parse_player(const nlohmann::json& value, side_channel_player& out) {
  if (auto names = value.find("names"); names != value.end() && names->is_object()) {
    out.netplay_name = string_member(*names, "netplay");
    out.connect_code = string_member(*names, "code");
  }
  if (auto characters = value.find("characters"); characters != value.end() && characters->is_object()) {
    for (const auto& [key, count] : characters->items()) {
      auto id = parse_key_number(key);
      if (!id || *id > 0xFF || !count.is_number_integer()) {
        continue;
      }
      out.characters[static_cast<uint8_t>(*id)] = count.get<uint32_t>();
    }
  }
}

} // namespace

status parse_side_channel(std::span<const uint8_t> block, side_channel_metadata& out) {
  if (block.empty()) {
    return make_status(error_code::malformed_header, "empty metadata block");
  }

  nlohmann::json root;
  try {
    root = nlohmann::json::from_ubjson(block.begin(), block.end(), false);
  } catch (const nlohmann::json::exception& e) {
    return make_status(error_code::malformed_header, std::string("metadata block unreadable: ") + e.what());
  }
  if (!root.is_object()) {
    return make_status(error_code::malformed_header, "metadata block is not an object");
  }

  side_channel_metadata parsed;
  parsed.start_at = string_member(root, "startAt");
  parsed.played_on = string_member(root, "playedOn");
  if (auto last = root.find("lastFrame"); last != root.end() && last->is_number_integer()) {
    parsed.last_frame = last->get<int32_t>();
  }
  if (auto players = root.find("players"); players != root.end() && players->is_object()) {
    for (const auto& [key, value] : players->items()) {
      auto port = parse_key_number(key);
      if (!port || *port > 3 || !value.is_object()) {
        continue;
      }
      parse_player(value, parsed.players[static_cast<uint8_t>(*port)]);
    }
  }

  out = std::move(parsed);
  return ok_status();
}

} // namespace slp::format

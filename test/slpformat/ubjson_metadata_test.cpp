#include <doctest/doctest.h>

#include <nlohmann/json.hpp>

#include "slpformat/ubjson_metadata.hpp"

using namespace slp;

TEST_CASE("side channel metadata is read from ubjson") {
  nlohmann::json metadata = {
      {"startAt", "2024-01-01T00:00:00Z"},
      {"lastFrame", 5000},
      {"playedOn", "dolphin"},
      {"players",
       {{"0", {{"names", {{"netplay", "Player"}, {"code", "PLAY#1"}}}, {"characters", {{"1", 5124}}}}},
        {"3", {{"characters", {{"18", 100}, {"x", 1}}}}},
        {"9", {{"characters", {{"1", 1}}}}}}},
  };
  const auto block = nlohmann::json::to_ubjson(metadata);

  format::side_channel_metadata parsed;
  REQUIRE(format::parse_side_channel(block, parsed).ok());
  CHECK(parsed.start_at == std::optional<std::string>("2024-01-01T00:00:00Z"));
  CHECK(parsed.played_on == std::optional<std::string>("dolphin"));
  CHECK(parsed.last_frame == std::optional<int32_t>(5000));
  REQUIRE(parsed.players.size() == 2);
  CHECK(parsed.players.at(0).netplay_name == std::optional<std::string>("Player"));
  CHECK(parsed.players.at(0).connect_code == std::optional<std::string>("PLAY#1"));
  CHECK(parsed.players.at(0).characters.at(1) == 5124);
  CHECK(parsed.players.at(3).characters.size() == 1);
  CHECK_FALSE(parsed.players.at(3).netplay_name.has_value());
}

TEST_CASE("unreadable side channel metadata is an error") {
  std::vector<uint8_t> garbage = {'{', 'U', 0x40};
  format::side_channel_metadata parsed;
  CHECK(format::parse_side_channel(garbage, parsed).code == error_code::malformed_header);

  const auto not_object = nlohmann::json::to_ubjson(nlohmann::json::array({1, 2}));
  CHECK(format::parse_side_channel(not_object, parsed).code == error_code::malformed_header);
}

#include <doctest/doctest.h>

#include "slpformat/event_codec.hpp"
#include "slpformat/replay_fixture.hpp"
#include "slpgame/replay_loader.hpp"
#include "slpio/json_encoder.hpp"
#include "slpquery/model_view.hpp"

using namespace slp;

namespace {

game::replay make_replay(format::format_version version, size_t frames = 4) {
  test_helpers::slp_fixture fixture(version);
  fixture.add_player({0, test_helpers::k_fox_external, test_helpers::k_fox_internal, 0, 4, 2, "Fox", "FOX#123"});
  fixture.add_player({3, test_helpers::k_marth_external, test_helpers::k_marth_internal, 1, 3});
  fixture.write_game(frames, {{0, test_helpers::k_state_wait}, {3, test_helpers::k_state_dead_left}});
  fixture.write_item(format::k_first_frame_index + static_cast<int32_t>(frames) - 1, 0x63, 7, 0);
  fixture.write_end(2, 3);
  auto loaded = game::load_replay(fixture.build());
  REQUIRE(loaded.ok());
  return std::move(loaded.value);
}

} // namespace

TEST_CASE("start record survives a trip through json") {
  const auto replay = make_replay(format::k_latest_version);
  io::json_options options;
  const auto original = io::to_json(query::start_node(replay.start), options);

  format::game_start restored;
  REQUIRE(io::game_start_from_json(original, restored).ok());
  CHECK(io::to_json(query::start_node(restored), options) == original);

  // and through the binary layout again
  format::game_start decoded;
  REQUIRE(format::decode_game_start(format::encode_game_start(restored), decoded).ok());
  CHECK(io::to_json(query::start_node(decoded), options) == original);
}

TEST_CASE("annotated start json reads back to the same codes") {
  const auto replay = make_replay(format::k_latest_version);
  io::json_options annotated;
  annotated.annotate = true;
  const auto text = io::to_json(query::start_node(replay.start), annotated);
  CHECK(text["stage"] == "31:BATTLEFIELD");
  CHECK(text["players"][1]["port"] == "P4");

  format::game_start restored;
  REQUIRE(io::game_start_from_json(text, restored).ok());
  CHECK(restored.stage == test_helpers::k_battlefield);
  REQUIRE(restored.players.size() == 2);
  CHECK(restored.players[1].port == 3);
  CHECK(restored.players[1].character == test_helpers::k_marth_external);
}

TEST_CASE("start json with bad values is rejected") {
  const auto replay = make_replay(format::k_latest_version);
  auto value = io::to_json(query::start_node(replay.start), {});

  format::game_start restored;
  auto bad_stage = value;
  bad_stage["stage"] = "BATTLEFIELD";
  CHECK(io::game_start_from_json(bad_stage, restored).code == error_code::invalid_argument);

  auto missing = value;
  missing.erase("timer");
  CHECK(io::game_start_from_json(missing, restored).code == error_code::invalid_argument);

  auto short_version = value;
  short_version["version"] = nlohmann::ordered_json::array({3, 16});
  CHECK(io::game_start_from_json(short_version, restored).code == error_code::invalid_argument);
}

TEST_CASE("fields newer than the replay render as null") {
  const auto replay = make_replay({1, 0, 0});
  const auto value = io::to_json(query::replay_node(replay), {});

  CHECK(value["start"]["version"] == nlohmann::ordered_json::array({1, 0, 0}));
  CHECK(value["start"]["is_pal"].is_null());
  CHECK(value["start"]["is_frozen_ps"].is_null());
  CHECK(value["start"]["match"].is_null());
  CHECK(value["start"]["players"][0]["name_tag"].is_null());
  CHECK(value["start"]["players"][0]["netplay"].is_null());
  CHECK_FALSE(value["start"]["players"][0]["ucf"].is_null());

  const auto& leader = value["frames"][0]["ports"][0]["leader"];
  CHECK(leader["pre"]["damage"].is_null());
  CHECK(leader["pre"]["raw_analog_x"].is_null());
  CHECK(leader["post"]["flags"].is_null());
  CHECK(leader["post"]["velocities"].is_null());
  CHECK(leader["post"]["state_age"] == 3.0);
  CHECK(value["frames"][0]["ports"][0]["follower"].is_null());
  CHECK(value["frames"][3]["items"][0]["owner"].is_null());
  CHECK(value["end"]["lras_initiator"].is_null());
  CHECK(value["end"]["placements"].is_null());
}

TEST_CASE("whole replay json keeps declaration order") {
  const auto replay = make_replay(format::k_latest_version);
  const auto value = io::to_json(query::replay_node(replay), {});

  std::vector<std::string> keys;
  for (const auto& [key, child] : value.items()) {
    keys.push_back(key);
  }
  CHECK(keys == std::vector<std::string>{"start", "end", "metadata", "frames"});
  CHECK(value["end"]["lras_initiator"] == 3);
  CHECK(value["metadata"]["frame_count"] == 4);
  CHECK(value["frames"].size() == 4);
  CHECK(value["frames"][3]["items"][0]["id"] == 7);
}

TEST_CASE("query results render wrapped or quiet") {
  const auto replay = make_replay(format::k_latest_version);
  const auto root = query::replay_node(replay);
  const auto results = query::run_queries(root, {"frames[-1].ports[].leader.post.state"});

  io::json_options plain;
  const auto wrapped = io::query_results_json(results, false, plain);
  CHECK(wrapped["frames[-1].ports[].leader.post.state"] == nlohmann::ordered_json::array({14, 1}));

  io::json_options annotated;
  annotated.annotate = true;
  const auto quiet = io::query_results_json(results, true, annotated);
  CHECK(quiet == nlohmann::ordered_json::array({"14:WAIT", "1:DEAD_LEFT"}));

  const auto single = io::query_results_json(query::run_queries(root, {"start.stage"}), true, plain);
  CHECK(single == 31);

  const auto several = io::query_results_json(query::run_queries(root, {"start.stage", "start.timer"}), true, plain);
  CHECK(several == nlohmann::ordered_json::array({31, 480}));
}

TEST_CASE("floats are written exactly") {
  const auto replay = make_replay(format::k_latest_version);
  const auto text = io::dump_json(query::replay_node(replay), {});
  const auto parsed = nlohmann::ordered_json::parse(text);
  const double x = parsed["frames"][1]["ports"][0]["leader"]["post"]["position"]["x"].get<double>();
  CHECK(static_cast<float>(x) == replay.frames[1].ports[0].leader.post->position.x);
}

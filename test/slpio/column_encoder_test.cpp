#include <doctest/doctest.h>

#include "slpformat/replay_fixture.hpp"
#include "slpgame/replay_loader.hpp"
#include "slpio/column_encoder.hpp"

using namespace slp;

namespace {

game::replay load_or_fail(const std::vector<uint8_t>& bytes) {
  auto loaded = game::load_replay(bytes);
  REQUIRE(loaded.ok());
  return std::move(loaded.value);
}

game::replay make_replay(format::format_version version, size_t frames) {
  test_helpers::slp_fixture fixture(version);
  fixture.add_player({0, test_helpers::k_fox_external, test_helpers::k_fox_internal});
  fixture.add_player({3, test_helpers::k_marth_external, test_helpers::k_marth_internal});
  fixture.write_game(frames);
  fixture.write_item(format::k_first_frame_index, 0x63, 7, 0);
  fixture.write_item(format::k_first_frame_index + 1, 0x63, 7, 0);
  fixture.write_item(format::k_first_frame_index + 1, 0x20, 8, 3);
  fixture.write_end(2);
  return load_or_fail(fixture.build());
}

io::column_table frame_table(const game::replay& replay) {
  io::column_table table;
  REQUIRE(io::build_frame_table(replay, 1, table).ok());
  return table;
}

} // namespace

TEST_CASE("frame table has one row per frame") {
  const auto replay = make_replay(format::k_latest_version, 10);
  const auto table = frame_table(replay);
  CHECK(table.rows == 10);
  REQUIRE(!table.columns.empty());
  CHECK(table.columns[0].name() == "index");
  CHECK(table.columns[0].int_at(0) == format::k_first_frame_index);
  CHECK(table.columns[0].int_at(9) == format::k_first_frame_index + 9);

  const auto* x = table.find("P1.leader.pre.position.x");
  REQUIRE(x != nullptr);
  CHECK(x->float_at(0) == static_cast<float>(format::k_first_frame_index) * 0.5f);
  const auto* state = table.find("P4.leader.post.state");
  REQUIRE(state != nullptr);
  CHECK(state->uint_at(3) == test_helpers::k_state_wait);
  CHECK(table.find("P4.leader.post.velocities.self_x_air") != nullptr);
  CHECK(table.find("start.random_seed") != nullptr);
  CHECK(table.find("P2.leader.pre.position.x") == nullptr);
}

TEST_CASE("follower columns appear only when a follower was recorded") {
  CHECK(frame_table(make_replay(format::k_latest_version, 3)).find("P1.follower.pre.state") == nullptr);

  test_helpers::slp_fixture fixture;
  fixture.add_player({0, test_helpers::k_ice_climbers_external, test_helpers::k_popo_internal});
  fixture.write_start();
  const int32_t first = format::k_first_frame_index;
  fixture.write_frame_start(first, 0);
  fixture.write_pre(first, 0, false, 14, 1.0f);
  fixture.write_post(first, 0, false, test_helpers::k_popo_internal, 14, 1.0f);
  fixture.write_pre(first, 0, true, 14, 2.0f);
  fixture.write_post(first, 0, true, test_helpers::k_nana_internal, 14, 2.0f);
  fixture.write_bookend(first);
  fixture.write_frame(first + 1);
  fixture.write_end(2);
  const auto table = frame_table(load_or_fail(fixture.build()));

  const auto* character = table.find("P1.follower.post.character");
  REQUIRE(character != nullptr);
  CHECK(character->uint_at(0) == test_helpers::k_nana_internal);
  // the second frame carries no follower
  CHECK_FALSE(character->uint_at(1).has_value());
  CHECK(table.find("P1.follower.pre.position.x")->float_at(0) == 2.0f);
}

TEST_CASE("fields newer than the replay get no column") {
  const auto table = frame_table(make_replay({2, 0, 0}, 3));
  CHECK(table.find("P1.leader.post.flags") != nullptr);
  CHECK(table.find("P1.leader.post.state_age") != nullptr);
  CHECK(table.find("P1.leader.post.hurtbox_state") == nullptr);
  CHECK(table.find("P1.leader.post.velocities.self_x_air") == nullptr);
  CHECK(table.find("P1.leader.pre.raw_analog_y") == nullptr);
  CHECK(table.find("start.random_seed") == nullptr);
  CHECK(table.find("start.scene_frame_counter") == nullptr);
  CHECK(table.find("end.latest_finalized_frame") == nullptr);
}

TEST_CASE("item table is keyed by frame") {
  const auto replay = make_replay(format::k_latest_version, 3);
  io::column_table table;
  REQUIRE(io::build_item_table(replay, 1, table).ok());
  CHECK(table.rows == 3);
  REQUIRE(table.find("frame") != nullptr);
  CHECK(table.find("frame")->int_at(0) == format::k_first_frame_index);
  CHECK(table.find("frame")->int_at(2) == format::k_first_frame_index + 1);
  CHECK(table.find("id")->uint_at(2) == 8u);
  CHECK(table.find("owner")->int_at(2) == 3);
  CHECK(table.find("misc.1")->uint_at(0) == 2u);
  CHECK(table.find("position.x")->float_at(0) == 5.0f);
}

TEST_CASE("columnar output is byte identical across runs and worker counts") {
  const auto replay = make_replay(format::k_latest_version, 50);
  for (auto codec : {io::column_codec::none, io::column_codec::lz4, io::column_codec::zstd}) {
    CAPTURE(static_cast<int>(codec));
    io::columnar_options serial{1, codec, io::k_default_compression_level};
    io::columnar_options parallel{4, codec, io::k_default_compression_level};

    std::vector<uint8_t> first;
    std::vector<uint8_t> second;
    std::vector<uint8_t> threaded;
    REQUIRE(io::encode_frame_table(replay, serial, first).ok());
    REQUIRE(io::encode_frame_table(replay, serial, second).ok());
    REQUIRE(io::encode_frame_table(replay, parallel, threaded).ok());
    CHECK(first == second);
    CHECK(first == threaded);

    std::vector<uint8_t> items_serial;
    std::vector<uint8_t> items_threaded;
    REQUIRE(io::encode_item_table(replay, serial, items_serial).ok());
    REQUIRE(io::encode_item_table(replay, parallel, items_threaded).ok());
    CHECK(items_serial == items_threaded);
  }
}

TEST_CASE("encoded frame table reads back") {
  const auto replay = make_replay(format::k_latest_version, 20);
  std::vector<uint8_t> bytes;
  REQUIRE(io::encode_frame_table(replay, {1, io::column_codec::zstd, io::k_default_compression_level}, bytes).ok());

  io::column_table restored;
  REQUIRE(io::read_arrow_file(bytes, restored).ok());
  const auto expected = frame_table(replay);
  REQUIRE(restored.columns.size() == expected.columns.size());
  for (size_t i = 0; i < expected.columns.size(); ++i) {
    CHECK(restored.columns[i].name() == expected.columns[i].name());
    CHECK(restored.columns[i].values() == expected.columns[i].values());
  }
}

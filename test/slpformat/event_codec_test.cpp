#include <doctest/doctest.h>

#include "slpformat/byte_cursor.hpp"
#include "slpformat/event_codec.hpp"
#include "slpformat/replay_fixture.hpp"

using namespace slp;

namespace {

format::decoded_event decode_or_fail(format::event_code code, std::span<const uint8_t> payload,
                                     const format::format_version& version) {
  format::decoded_event out;
  auto st = format::decode_event(static_cast<uint8_t>(code), payload, version, out);
  REQUIRE(st.ok());
  return out;
}

std::vector<uint8_t> last_payload(const std::vector<uint8_t>& file, size_t size) {
  // fixture files end with the closing '}' of the container
  return std::vector<uint8_t>(file.end() - 1 - static_cast<std::ptrdiff_t>(size), file.end() - 1);
}

} // namespace

TEST_CASE("byte cursor reads big-endian values") {
  std::vector<uint8_t> data;
  format::byte_writer writer(data);
  writer.write_u16(0x1234);
  writer.write_i32(-2);
  writer.write_u40(0x0102030405ull);
  writer.write_f32(1.5f);

  format::byte_reader reader(data, 100);
  uint16_t u16 = 0;
  int32_t i32 = 0;
  uint64_t u40 = 0;
  float f32 = 0;
  REQUIRE(reader.read_u16(u16));
  REQUIRE(reader.read_i32(i32));
  REQUIRE(reader.read_u40(u40));
  REQUIRE(reader.read_f32(f32));
  CHECK(data[0] == 0x12);
  CHECK(u16 == 0x1234);
  CHECK(i32 == -2);
  CHECK(u40 == 0x0102030405ull);
  CHECK(f32 == 1.5f);
  CHECK(reader.at_end());
  CHECK(reader.absolute_offset() == 100 + data.size());

  uint8_t extra = 0;
  CHECK_FALSE(reader.read_u8(extra));
}

TEST_CASE("game start decodes active players and version-gated fields") {
  test_helpers::slp_fixture fixture({3, 16, 0});
  fixture.add_player({0, test_helpers::k_fox_external, test_helpers::k_fox_internal, 0, 4, 1, "Fox", "FOX#123"});
  fixture.add_player({2, test_helpers::k_marth_external, test_helpers::k_marth_internal, 1, 3, 0, "", ""});

  format::game_start start;
  REQUIRE(format::decode_game_start(fixture.start_payload(), start).ok());
  CHECK(start.slippi == format::format_version{3, 16, 0});
  CHECK(start.stage == test_helpers::k_battlefield);
  CHECK(start.timer == 480);
  CHECK(start.item_spawn_frequency == -1);
  CHECK(start.damage_ratio == 1.0f);
  CHECK(start.random_seed == 0xC0FFEE);

  REQUIRE(start.players.size() == 2);
  CHECK(start.players[0].port == 0);
  CHECK(start.players[0].character == test_helpers::k_fox_external);
  CHECK(start.players[0].costume == 1);
  CHECK(start.players[1].port == 2);
  CHECK(start.players[1].type == 1);
  CHECK(start.players[1].stocks == 3);

  REQUIRE(start.players[0].ucf.has_value());
  CHECK(start.players[0].ucf->dash_back == 1);
  REQUIRE(start.players[0].netplay.has_value());
  CHECK(start.players[0].netplay->name == "Fox");
  CHECK(start.players[0].netplay->code == "FOX#123");
  CHECK(start.is_frozen_ps == std::optional<bool>(true));
  REQUIRE(start.scene.has_value());
  CHECK(start.scene->major == 8);
  CHECK(start.language == std::optional<uint8_t>(1));
  REQUIRE(start.match.has_value());
  CHECK(start.match->id == "mode.ranked-2024-01-01T00:00:00.00-0");
  CHECK(start.match->game_number == 3);
}

TEST_CASE("game start from an old version leaves newer fields absent") {
  test_helpers::slp_fixture fixture({1, 0, 0});
  fixture.add_player({0});

  format::game_start start;
  REQUIRE(format::decode_game_start(fixture.start_payload(), start).ok());
  REQUIRE(start.players.size() == 1);
  CHECK(start.players[0].ucf.has_value());
  CHECK_FALSE(start.players[0].name_tag.has_value());
  CHECK_FALSE(start.players[0].netplay.has_value());
  CHECK_FALSE(start.is_pal.has_value());
  CHECK_FALSE(start.is_frozen_ps.has_value());
  CHECK_FALSE(start.scene.has_value());
  CHECK_FALSE(start.language.has_value());
  CHECK_FALSE(start.match.has_value());
}

TEST_CASE("game start shorter than its version requires is malformed") {
  test_helpers::slp_fixture fixture({3, 16, 0});
  fixture.add_player({0});
  auto payload = fixture.start_payload();
  payload.resize(0x200);

  format::game_start start;
  auto st = format::decode_game_start(payload, start);
  CHECK(st.code == error_code::malformed_event);
  CHECK(st.message.find("display_names") != std::string::npos);
}

TEST_CASE("frame events honour their version gates") {
  test_helpers::slp_fixture fixture;
  fixture.write_pre(10, 1, false, test_helpers::k_state_wait, 2.0f);
  const auto file = fixture.build();
  const auto payload = last_payload(file, test_helpers::k_pre_size);

  auto latest = std::get<format::pre_frame_event>(
      decode_or_fail(format::event_code::pre_frame, payload, format::k_latest_version)
  );
  CHECK(latest.frame == 10);
  CHECK(latest.port == 1);
  CHECK(latest.data.state == test_helpers::k_state_wait);
  CHECK(latest.data.position.x == 2.0f);
  CHECK(latest.data.raw_analog_x == std::optional<int8_t>(-3));
  CHECK(latest.data.damage == std::optional<float>(12.5f));
  CHECK(latest.data.raw_analog_y == std::optional<int8_t>(7));

  auto old = std::get<format::pre_frame_event>(decode_or_fail(format::event_code::pre_frame, payload, {1, 2, 0}));
  CHECK(old.data.raw_analog_x.has_value());
  CHECK_FALSE(old.data.damage.has_value());
  CHECK_FALSE(old.data.raw_analog_y.has_value());
}

TEST_CASE("post frame decodes flags and velocities") {
  test_helpers::slp_fixture fixture;
  fixture.write_post(-5, 0, true, test_helpers::k_nana_internal, 20, 4.0f);
  const auto file = fixture.build();
  const auto payload = last_payload(file, test_helpers::k_post_size);

  auto post = std::get<format::post_frame_event>(
      decode_or_fail(format::event_code::post_frame, payload, format::k_latest_version)
  );
  CHECK(post.frame == -5);
  CHECK(post.is_follower);
  CHECK(post.data.character == test_helpers::k_nana_internal);
  CHECK(post.data.state == 20);
  CHECK(post.data.shield == 60.0f);
  CHECK(post.data.stocks == 4);
  CHECK(post.data.flags == std::optional<uint64_t>(0x80));
  CHECK(post.data.ground == std::optional<uint16_t>(2));
  REQUIRE(post.data.velocity.has_value());
  CHECK(post.data.velocity->self_x_air == 0.5f);
  CHECK(post.data.animation_index == std::optional<uint32_t>(42));
}

TEST_CASE("short frame payloads are malformed") {
  std::vector<uint8_t> payload(0x20, 0);
  format::decoded_event out;
  auto st = format::decode_event(
      static_cast<uint8_t>(format::event_code::pre_frame), payload, format::k_latest_version, out
  );
  CHECK(st.code == error_code::malformed_event);
}

TEST_CASE("game end encodes and decodes by version") {
  format::game_end end;
  end.method = 2;
  end.lras_initiator = 1;
  end.placements = std::array<int8_t, 4>{1, 0, -1, -1};

  const auto bytes = format::encode_game_end(end, format::k_latest_version);
  CHECK(bytes.size() == test_helpers::k_end_size);

  format::game_end decoded;
  REQUIRE(format::decode_game_end(bytes, format::k_latest_version, decoded).ok());
  CHECK(decoded.method == 2);
  CHECK(decoded.lras_initiator == std::optional<int8_t>(1));
  CHECK(decoded.placements == end.placements);

  const auto old_bytes = format::encode_game_end(end, {1, 0, 0});
  CHECK(old_bytes.size() == 1);
  format::game_end old;
  REQUIRE(format::decode_game_end(old_bytes, {1, 0, 0}, old).ok());
  CHECK_FALSE(old.lras_initiator.has_value());
  CHECK_FALSE(old.placements.has_value());
}

TEST_CASE("encoded game start matches the recorded layout") {
  test_helpers::slp_fixture fixture({3, 16, 0});
  fixture.add_player({0, test_helpers::k_fox_external, test_helpers::k_fox_internal, 0, 4, 0, "A", "AAAA#1"});
  fixture.add_player({1, test_helpers::k_marth_external, test_helpers::k_marth_internal, 0, 4, 0, "B", "BBBB#2"});
  const auto payload = fixture.start_payload();

  format::game_start start;
  REQUIRE(format::decode_game_start(payload, start).ok());

  const auto encoded = format::encode_game_start(start);
  format::game_start again;
  REQUIRE(format::decode_game_start(encoded, again).ok());
  REQUIRE(again.players.size() == start.players.size());
  for (size_t i = 0; i < start.players.size(); ++i) {
    CHECK(again.players[i].port == start.players[i].port);
    CHECK(again.players[i].character == start.players[i].character);
    CHECK(again.players[i].netplay->code == start.players[i].netplay->code);
  }
  CHECK(again.match->id == start.match->id);
  CHECK(again.random_seed == start.random_seed);
}

TEST_CASE("event codes have names") {
  CHECK(std::string(format::event_code_name(0x36)) == "game_start");
  CHECK(std::string(format::event_code_name(0x3C)) == "frame_bookend");
  CHECK(std::string(format::event_code_name(0x99)) == "unknown");
  CHECK(format::is_decodable_event(0x37));
  CHECK_FALSE(format::is_decodable_event(0x35));
  CHECK_FALSE(format::is_decodable_event(0x20));
}

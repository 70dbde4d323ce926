#include <doctest/doctest.h>

#include <vector>

#include "slpformat/event_stream.hpp"
#include "slpformat/replay_fixture.hpp"

using namespace slp;

namespace {

test_helpers::slp_fixture two_player_fixture() {
  test_helpers::slp_fixture fixture;
  fixture.add_player({0, test_helpers::k_fox_external, test_helpers::k_fox_internal});
  fixture.add_player({1, test_helpers::k_marth_external, test_helpers::k_marth_internal});
  return fixture;
}

std::vector<format::stream_event> drain(format::event_stream_reader& reader) {
  std::vector<format::stream_event> events;
  format::stream_event event;
  while (reader.read_next(event)) {
    events.push_back(event);
  }
  return events;
}

} // namespace

TEST_CASE("container rejects files that are not replays") {
  format::stream_container container;
  std::vector<uint8_t> tiny = {'{', 'U'};
  CHECK(format::parse_container(tiny, container).code == error_code::malformed_header);

  std::vector<uint8_t> wrong(32, 0);
  CHECK(format::parse_container(wrong, container).code == error_code::malformed_header);
}

TEST_CASE("container locates the metadata block") {
  auto fixture = two_player_fixture();
  fixture.write_start();
  fixture.set_metadata({{"lastFrame", -100}});
  const auto file = fixture.build();

  format::stream_container container;
  REQUIRE(format::parse_container(file, container).ok());
  CHECK(container.length_declared);
  CHECK_FALSE(container.raw_truncated);
  REQUIRE_FALSE(container.metadata.empty());
  CHECK(container.metadata[0] == '{');
}

TEST_CASE("stream yields decoded events with offsets") {
  auto fixture = two_player_fixture();
  fixture.write_game(3);
  fixture.write_end(2);
  const auto file = fixture.build();

  format::event_stream_reader reader(file);
  REQUIRE(reader.open());
  const auto events = drain(reader);
  CHECK(reader.stream_status().ok());
  CHECK_FALSE(reader.truncated());
  REQUIRE(reader.version().has_value());
  CHECK(*reader.version() == format::k_latest_version);

  // start, 3 x (frame start, 2 x (pre, post), bookend), end
  REQUIRE(events.size() == 1 + 3 * 6 + 1);
  CHECK(events.front().code == static_cast<uint8_t>(format::event_code::game_start));
  CHECK(std::holds_alternative<format::game_start_event>(events.front().event));
  CHECK(events[1].offset == fixture.frame_offset(format::k_first_frame_index));
  CHECK(std::holds_alternative<format::game_end_event>(events.back().event));
  CHECK(reader.payload_sizes().at(static_cast<uint8_t>(format::event_code::pre_frame)) == test_helpers::k_pre_size);
}

TEST_CASE("first event must be the payload size table") {
  auto fixture = two_player_fixture();
  fixture.write_start();
  auto file = fixture.build();
  file[format::k_container_header_size] = 0x36;

  format::event_stream_reader reader(file);
  CHECK_FALSE(reader.open());
  CHECK(reader.stream_status().code == error_code::malformed_header);
}

TEST_CASE("unknown event code before game start is fatal") {
  auto fixture = two_player_fixture();
  fixture.write_raw_event(0x20, std::vector<uint8_t>{});
  fixture.write_start();
  const auto file = fixture.build();

  format::event_stream_reader reader(file);
  REQUIRE(reader.open());
  CHECK(drain(reader).empty());
  CHECK(reader.stream_status().code == error_code::unknown_event_code);
  CHECK(reader.stream_status().message.find("0x20") != std::string::npos);
}

TEST_CASE("unknown event code after game start stops the stream") {
  auto fixture = two_player_fixture();
  fixture.write_game(2);
  fixture.write_raw_event(0x20, std::vector<uint8_t>{1, 2, 3});
  fixture.write_frame(format::k_first_frame_index + 2);
  const auto file = fixture.build();

  format::event_stream_reader reader(file);
  REQUIRE(reader.open());
  const auto events = drain(reader);
  CHECK(reader.stream_status().ok());
  CHECK(events.size() == 1 + 2 * 6);
  REQUIRE(reader.diagnostics().size() == 1);
  CHECK(reader.diagnostics()[0].kind == format::diagnostic_kind::unknown_event_code);
  CHECK(reader.diagnostics()[0].code == 0x20);
}

TEST_CASE("declared events without a decoder are skipped") {
  auto fixture = two_player_fixture();
  fixture.declare_payload(0x40, 4);
  fixture.write_game(1);
  fixture.write_raw_event(0x40, std::vector<uint8_t>{9, 9, 9, 9});
  fixture.write_end(2);
  const auto file = fixture.build();

  format::event_stream_reader reader(file);
  REQUIRE(reader.open());
  const auto events = drain(reader);
  CHECK(reader.stream_status().ok());
  CHECK(events.size() == 1 + 6 + 1);
  CHECK(reader.diagnostics().empty());
}

TEST_CASE("event cut off mid-payload reports truncation") {
  auto fixture = two_player_fixture();
  fixture.write_game(5);
  auto file = fixture.build();
  file.resize(fixture.frame_offset(format::k_first_frame_index + 4) + 10);

  format::event_stream_reader reader(file);
  REQUIRE(reader.open());
  const auto events = drain(reader);
  CHECK(events.size() == 1 + 4 * 6);
  CHECK(reader.truncated());
  CHECK(reader.stream_status().code == error_code::truncated_stream);
  REQUIRE_FALSE(reader.diagnostics().empty());
  CHECK(reader.diagnostics().back().kind == format::diagnostic_kind::truncated_stream);
  CHECK(reader.diagnostics().back().offset == fixture.frame_offset(format::k_first_frame_index + 4));
}

TEST_CASE("undeclared raw length reads to the end of the file") {
  auto fixture = two_player_fixture();
  fixture.set_length_undeclared();
  fixture.write_game(2);
  auto file = fixture.build();
  file.pop_back(); // recorder still running, no closing brace

  format::event_stream_reader reader(file);
  REQUIRE(reader.open());
  CHECK_FALSE(reader.container().length_declared);
  const auto events = drain(reader);
  CHECK(events.size() == 1 + 2 * 6);
  CHECK(reader.stream_status().ok());
}

TEST_CASE("malformed start is fatal") {
  auto fixture = two_player_fixture();
  fixture.declare_payload(static_cast<uint8_t>(format::event_code::game_start), 0x100);
  auto payload = fixture.start_payload();
  payload.resize(0x100);
  fixture.write_event(format::event_code::game_start, payload);
  const auto file = fixture.build();

  format::event_stream_reader reader(file);
  REQUIRE(reader.open());
  CHECK(drain(reader).empty());
  CHECK(reader.stream_status().code == error_code::malformed_event);
}

TEST_CASE("repeated game start is skipped") {
  auto fixture = two_player_fixture();
  fixture.write_start();
  fixture.write_start();
  fixture.write_frame(format::k_first_frame_index);
  const auto file = fixture.build();

  format::event_stream_reader reader(file);
  REQUIRE(reader.open());
  const auto events = drain(reader);
  CHECK(events.size() == 1 + 6);
  REQUIRE(reader.diagnostics().size() == 1);
  CHECK(reader.diagnostics()[0].kind == format::diagnostic_kind::skipped_event);
}

TEST_CASE("split messages are reassembled") {
  auto fixture = two_player_fixture();
  std::vector<uint8_t> codes(1200);
  for (size_t i = 0; i < codes.size(); ++i) {
    codes[i] = static_cast<uint8_t>(i * 31);
  }
  fixture.write_split_message(static_cast<uint8_t>(format::event_code::gecko_list), codes);
  fixture.write_start();
  const auto file = fixture.build();

  format::event_stream_reader reader(file);
  REQUIRE(reader.open());
  const auto events = drain(reader);
  REQUIRE(events.size() == 2);
  const auto* gecko = std::get_if<format::gecko_list_event>(&events[0].event);
  REQUIRE(gecko != nullptr);
  CHECK(gecko->codes == codes);
  CHECK(events[0].code == static_cast<uint8_t>(format::event_code::gecko_list));
  CHECK(std::holds_alternative<format::game_start_event>(events[1].event));
}

#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "slpbase/sjis.hpp"

TEST_CASE("shift-jis ascii decodes up to the first nul") {
  std::vector<uint8_t> bytes = {'A', 'B', 'C', 0, 'D'};
  CHECK(slp::util::decode_shift_jis(bytes) == "ABC");
}

TEST_CASE("shift-jis fullwidth text folds to ascii on request") {
  // fullwidth "Ａ＃１"
  std::vector<uint8_t> bytes = {0x82, 0x60, 0x81, 0x94, 0x82, 0x50, 0x00};
  CHECK(slp::util::decode_shift_jis(bytes) == "\xEF\xBC\xA1\xEF\xBC\x83\xEF\xBC\x91");
  CHECK(slp::util::decode_shift_jis(bytes, true) == "A#1");
}

TEST_CASE("shift-jis encoding pads and round trips kana") {
  const std::string hiragana = "\xE3\x81\x82\xE3\x81\x84"; // "あい"
  const auto encoded = slp::util::encode_shift_jis(hiragana, 8);
  REQUIRE(encoded.size() == 8);
  CHECK(encoded[0] == 0x82);
  CHECK(encoded[1] == 0xA0);
  CHECK(encoded[4] == 0);
  CHECK(slp::util::decode_shift_jis(encoded) == hiragana);
}

TEST_CASE("shift-jis encoding never splits a double-byte character") {
  const auto encoded = slp::util::encode_shift_jis("a\xE3\x81\x82", 2);
  REQUIRE(encoded.size() == 2);
  CHECK(encoded[0] == 'a');
  CHECK(encoded[1] == 0);
}

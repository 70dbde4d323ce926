#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "slpbase/result.hpp"

#include "byte_cursor.hpp"
#include "event_format.hpp"

namespace slp::format {

// One version-gated field of an event payload. Rules are applied in table order; a rule
// whose version is not reached leaves its target untouched (empty optional).
template <typename T> struct field_rule {
  const char* name = "";
  format_version since;
  size_t offset = 0;
  size_t size = 0;
  bool (*decode)(byte_reader&, T&) = nullptr;
  void (*encode)(byte_writer&, const T&) = nullptr;
};

// true for codes that decode_event understands
bool is_decodable_event(uint8_t code);

// Decodes one payload (bytes after the code byte). `version` comes from the Start event and
// is ignored when decoding the Start event itself.
status decode_event(uint8_t code, std::span<const uint8_t> payload, const format_version& version, decoded_event& out);

status decode_game_start(std::span<const uint8_t> payload, game_start& out);
status decode_game_end(std::span<const uint8_t> payload, const format_version& version, game_end& out);

// Encoders write every field the start's declared version carries, in the same layout the
// decoder reads.
std::vector<uint8_t> encode_game_start(const game_start& start);
std::vector<uint8_t> encode_game_end(const game_end& end, const format_version& version);

} // namespace slp::format

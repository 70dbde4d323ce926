#include "event_stream.hpp"

#include <array>
#include <cstdio>
#include <utility>

#include <redlog.hpp>

#include "byte_cursor.hpp"
#include "event_codec.hpp"

namespace slp::format {

namespace {

constexpr std::array<uint8_t, 11> k_container_prefix = {'{', 'U', 0x03, 'r', 'a', 'w', '[', '$', 'U', '#', 'l'};
constexpr std::array<uint8_t, 10> k_metadata_key = {'U', 0x08, 'm', 'e', 't', 'a', 'd', 'a', 't', 'a'};

std::string hex_code(uint8_t code) {
  char buffer[8];
  std::snprintf(buffer, sizeof(buffer), "0x%02X", code);
  return buffer;
}

std::string event_context(uint8_t code, size_t offset) {
  return "event " + hex_code(code) + " (" + event_code_name(code) + ") at offset " + std::to_string(offset);
}

} // namespace

status parse_container(std::span<const uint8_t> file, stream_container& out) {
  if (file.size() < k_container_header_size) {
    return make_status(
        error_code::malformed_header, "file too short for replay header (" + std::to_string(file.size()) + " bytes)"
    );
  }
  for (size_t i = 0; i < k_container_prefix.size(); ++i) {
    if (file[i] != k_container_prefix[i]) {
      return make_status(error_code::malformed_header, "not a slippi replay: bad header byte at offset " + std::to_string(i));
    }
  }

  byte_reader reader(file);
  uint32_t raw_length = 0;
  if (!reader.seek(k_container_prefix.size()) || !reader.read_u32(raw_length)) {
    return make_status(error_code::malformed_header, "raw length unreadable");
  }

  stream_container container;
  container.raw_offset = k_container_header_size;
  const size_t available = file.size() - k_container_header_size;
  if (raw_length == 0) {
    container.length_declared = false;
    container.raw = file.subspan(k_container_header_size);
  } else if (raw_length > available) {
    container.raw_truncated = true;
    container.raw = file.subspan(k_container_header_size);
  } else {
    container.raw = file.subspan(k_container_header_size, raw_length);
    const size_t after = k_container_header_size + raw_length;
    if (file.size() - after > k_metadata_key.size()) {
      bool keyed = true;
      for (size_t i = 0; i < k_metadata_key.size(); ++i) {
        keyed = keyed && file[after + i] == k_metadata_key[i];
      }
      if (keyed) {
        container.metadata = file.subspan(after + k_metadata_key.size());
      }
    }
  }

  out = container;
  return ok_status();
}

event_stream_reader::event_stream_reader(std::span<const uint8_t> file) : file_(file) {}

bool event_stream_reader::open() {
  auto log = redlog::get_logger("slpkit.stream");

  auto st = parse_container(file_, container_);
  if (!st.ok()) {
    status_ = st;
    finished_ = true;
    log.err("replay container rejected", redlog::field("error", st.message));
    return false;
  }
  if (!read_payload_sizes()) {
    return false;
  }
  opened_ = true;

  log.dbg(
      "replay container opened", redlog::field("raw_size", container_.raw.size()),
      redlog::field("declared", container_.length_declared), redlog::field("event_kinds", payload_sizes_.size()),
      redlog::field("has_metadata", !container_.metadata.empty())
  );
  return true;
}

bool event_stream_reader::read_payload_sizes() {
  const auto raw = container_.raw;
  if (raw.empty() || raw[0] != static_cast<uint8_t>(event_code::event_payloads)) {
    return fail(error_code::malformed_header, "first event is not event payloads at offset " + std::to_string(container_.raw_offset));
  }
  if (raw.size() < 2) {
    return fail(error_code::malformed_header, "event payloads size missing");
  }

  const uint8_t table_size = raw[1];
  if (table_size < 1 || raw.size() < 1 + static_cast<size_t>(table_size)) {
    return fail(error_code::malformed_header, "event payloads table truncated");
  }

  byte_reader reader(raw.subspan(2, table_size - 1), container_.raw_offset + 2);
  payload_sizes_[static_cast<uint8_t>(event_code::event_payloads)] = table_size;
  while (reader.remaining() >= 3) {
    uint8_t code = 0;
    uint16_t size = 0;
    if (!reader.read_u8(code) || !reader.read_u16(size)) {
      return fail(error_code::malformed_header, "event payloads entry unreadable");
    }
    payload_sizes_[code] = size;
  }
  cursor_ = 1 + static_cast<size_t>(table_size);
  return true;
}

bool event_stream_reader::read_next(stream_event& out) {
  auto log = redlog::get_logger("slpkit.stream");
  const auto raw = container_.raw;

  while (opened_ && !finished_) {
    if (cursor_ >= raw.size()) {
      finished_ = true;
      if (container_.raw_truncated) {
        truncated_ = true;
        status_ = make_status(error_code::truncated_stream, "replay ends before its declared raw length");
        note(diagnostic_kind::truncated_stream, container_.raw_offset + cursor_, 0, status_.message);
        log.wrn("replay truncated", redlog::field("offset", container_.raw_offset + cursor_));
      }
      return false;
    }

    const uint8_t code = raw[cursor_];
    const size_t offset = container_.raw_offset + cursor_;
    auto size_it = payload_sizes_.find(code);
    if (size_it == payload_sizes_.end()) {
      if (!started()) {
        return fail(error_code::unknown_event_code, "unknown " + event_context(code, offset) + " before game start");
      }
      finished_ = true;
      note(diagnostic_kind::unknown_event_code, offset, code, "unknown " + event_context(code, offset) + ", stream stopped");
      log.wrn("unknown event code, stopping", redlog::field("code", hex_code(code)), redlog::field("offset", offset));
      return false;
    }

    const size_t size = size_it->second;
    if (cursor_ + 1 + size > raw.size()) {
      finished_ = true;
      truncated_ = true;
      status_ = make_status(
          error_code::truncated_stream, event_context(code, offset) + " needs " + std::to_string(size) + " bytes, " +
                                            std::to_string(raw.size() - cursor_ - 1) + " remain"
      );
      note(diagnostic_kind::truncated_stream, offset, code, status_.message);
      log.wrn("replay truncated mid-event", redlog::field("code", hex_code(code)), redlog::field("offset", offset));
      return false;
    }
    const auto payload = raw.subspan(cursor_ + 1, size);
    cursor_ += 1 + size;

    if (code == static_cast<uint8_t>(event_code::game_start)) {
      if (started()) {
        note(diagnostic_kind::skipped_event, offset, code, "repeated game start ignored");
        log.wrn("repeated game start ignored", redlog::field("offset", offset));
        continue;
      }
      auto st = decode_event(code, payload, format_version{}, out.event);
      if (!st.ok()) {
        return fail(error_code::malformed_event, event_context(code, offset) + ": " + st.message);
      }
      version_ = std::get<game_start_event>(out.event).data.slippi;
      log.dbg("game start decoded", redlog::field("version", version_->to_string()), redlog::field("offset", offset));
      out.code = code;
      out.offset = offset;
      return true;
    }

    const bool fragment = code == static_cast<uint8_t>(event_code::message_splitter) ||
                          code == static_cast<uint8_t>(event_code::gecko_list);
    if (!started() && !fragment) {
      note(diagnostic_kind::skipped_event, offset, code, event_context(code, offset) + " before game start");
      log.wrn("event before game start skipped", redlog::field("code", hex_code(code)), redlog::field("offset", offset));
      continue;
    }
    if (!is_decodable_event(code)) {
      log.trc("event without decoder skipped", redlog::field("code", hex_code(code)), redlog::field("size", size));
      continue;
    }

    auto st = decode_event(code, payload, version_.value_or(format_version{}), out.event);
    if (!st.ok()) {
      note(diagnostic_kind::malformed_event, offset, code, event_context(code, offset) + ": " + st.message);
      log.wrn("malformed event skipped", redlog::field("code", hex_code(code)), redlog::field("offset", offset),
              redlog::field("error", st.message));
      continue;
    }

    if (code == static_cast<uint8_t>(event_code::message_splitter)) {
      auto fragment_event = std::get<message_splitter_event>(std::move(out.event));
      if (accept_fragment(fragment_event, offset, out)) {
        return true;
      }
      continue;
    }

    out.code = code;
    out.offset = offset;
    return true;
  }
  return false;
}

bool event_stream_reader::accept_fragment(const message_splitter_event& fragment, size_t offset, stream_event& out) {
  auto log = redlog::get_logger("slpkit.stream");

  pending_message_.insert(pending_message_.end(), fragment.data.begin(), fragment.data.end());
  if (!fragment.last_message) {
    return false;
  }

  std::vector<uint8_t> message = std::move(pending_message_);
  pending_message_.clear();
  const uint8_t code = fragment.internal_command;
  log.dbg("split message reassembled", redlog::field("code", hex_code(code)), redlog::field("size", message.size()));

  if (code == static_cast<uint8_t>(event_code::message_splitter) || !is_decodable_event(code) ||
      code == static_cast<uint8_t>(event_code::game_start)) {
    note(diagnostic_kind::skipped_event, offset, code, "split message for " + hex_code(code) + " ignored");
    return false;
  }

  auto st = decode_event(code, message, version_.value_or(format_version{}), out.event);
  if (!st.ok()) {
    note(diagnostic_kind::malformed_event, offset, code, "split " + event_context(code, offset) + ": " + st.message);
    log.wrn("malformed split message skipped", redlog::field("code", hex_code(code)), redlog::field("error", st.message));
    return false;
  }
  out.code = code;
  out.offset = offset;
  return true;
}

bool event_stream_reader::fail(error_code code, std::string message) {
  auto log = redlog::get_logger("slpkit.stream");
  status_ = make_status(code, std::move(message));
  finished_ = true;
  log.err("replay stream failed", redlog::field("error", status_.message));
  return false;
}

void event_stream_reader::note(diagnostic_kind kind, size_t offset, uint8_t code, std::string message) {
  decode_diagnostic diagnostic;
  diagnostic.kind = kind;
  diagnostic.offset = offset;
  diagnostic.code = code;
  diagnostic.message = std::move(message);
  diagnostics_.push_back(std::move(diagnostic));
}

} // namespace slp::format

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "slpbase/result.hpp"

#include "diagnostic.hpp"
#include "event_format.hpp"

namespace slp::format {

// `{U\x03raw[$U#l` followed by the big-endian raw length
constexpr size_t k_container_header_size = 15;

struct stream_container {
  std::span<const uint8_t> raw;
  size_t raw_offset = 0;
  bool length_declared = true; // false while the file is still being written
  bool raw_truncated = false; // declared length runs past the end of the file
  std::span<const uint8_t> metadata; // starts at the metadata object's '{', empty when absent
};

status parse_container(std::span<const uint8_t> file, stream_container& out);

struct stream_event {
  uint8_t code = 0;
  size_t offset = 0; // absolute offset of the code byte
  decoded_event event;
};

// Pulls decoded events out of an in-memory .slp file. Malformed non-Start events are skipped
// and recorded; fatal problems end the stream with a non-ok status().
class event_stream_reader {
public:
  explicit event_stream_reader(std::span<const uint8_t> file);

  // parses the container and the payload size table
  bool open();

  // false at end of stream or on a fatal error; check status() to tell them apart
  bool read_next(stream_event& out);

  const status& stream_status() const { return status_; }
  bool truncated() const { return truncated_; }
  bool started() const { return version_.has_value(); }
  const std::optional<format_version>& version() const { return version_; }
  const stream_container& container() const { return container_; }
  const std::map<uint8_t, uint16_t>& payload_sizes() const { return payload_sizes_; }
  std::vector<decode_diagnostic>& diagnostics() { return diagnostics_; }

private:
  bool read_payload_sizes();
  bool fail(error_code code, std::string message);
  void note(diagnostic_kind kind, size_t offset, uint8_t code, std::string message);
  bool accept_fragment(const message_splitter_event& fragment, size_t offset, stream_event& out);

  std::span<const uint8_t> file_;
  stream_container container_{};
  std::map<uint8_t, uint16_t> payload_sizes_{};
  size_t cursor_ = 0;
  std::optional<format_version> version_{};
  std::vector<uint8_t> pending_message_{};
  std::vector<decode_diagnostic> diagnostics_{};
  status status_{};
  bool opened_ = false;
  bool finished_ = false;
  bool truncated_ = false;
};

} // namespace slp::format

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace slp::format {

enum class diagnostic_kind {
  malformed_event,
  unknown_event_code,
  skipped_event,
  rejected_event,
  rollback,
  frame_gap,
  truncated_stream,
  metadata_mismatch,
  metadata_unreadable,
};

inline std::string_view diagnostic_kind_name(diagnostic_kind kind) {
  switch (kind) {
  case diagnostic_kind::malformed_event:
    return "malformed_event";
  case diagnostic_kind::unknown_event_code:
    return "unknown_event_code";
  case diagnostic_kind::skipped_event:
    return "skipped_event";
  case diagnostic_kind::rejected_event:
    return "rejected_event";
  case diagnostic_kind::rollback:
    return "rollback";
  case diagnostic_kind::frame_gap:
    return "frame_gap";
  case diagnostic_kind::truncated_stream:
    return "truncated_stream";
  case diagnostic_kind::metadata_mismatch:
    return "metadata_mismatch";
  case diagnostic_kind::metadata_unreadable:
    return "metadata_unreadable";
  }
  return "unknown";
}

// recoverable problem found while decoding; kept on the replay
struct decode_diagnostic {
  diagnostic_kind kind = diagnostic_kind::skipped_event;
  size_t offset = 0; // absolute byte offset of the event code, 0 when not tied to an event
  uint8_t code = 0;
  std::optional<int32_t> frame;
  std::string message;
};

} // namespace slp::format

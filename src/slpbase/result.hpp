#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace slp {

// error codes shared by every slpkit layer
enum class error_code {
  ok,
  malformed_header,
  unknown_event_code,
  truncated_stream,
  malformed_event,
  inconsistent_replay,
  no_such_field,
  index_out_of_range,
  invalid_query,
  io_error,
  invalid_argument
};

inline std::string_view error_code_name(error_code code) {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::malformed_header:
    return "malformed_header";
  case error_code::unknown_event_code:
    return "unknown_event_code";
  case error_code::truncated_stream:
    return "truncated_stream";
  case error_code::malformed_event:
    return "malformed_event";
  case error_code::inconsistent_replay:
    return "inconsistent_replay";
  case error_code::no_such_field:
    return "no_such_field";
  case error_code::index_out_of_range:
    return "index_out_of_range";
  case error_code::invalid_query:
    return "invalid_query";
  case error_code::io_error:
    return "io_error";
  case error_code::invalid_argument:
    return "invalid_argument";
  }
  return "unknown";
}

// status holds an error code and a human-readable message
struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message)}; }

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  status status_info{};

  bool ok() const noexcept { return status_info.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

} // namespace slp

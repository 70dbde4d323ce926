#include "replay_loader.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <utility>

#include <redlog.hpp>

#include "slpformat/event_stream.hpp"
#include "slpformat/ubjson_metadata.hpp"

#include "replay_builder.hpp"

namespace slp::game {

status read_replay_bytes(const std::string& path, std::vector<uint8_t>& out) {
  if (path == "-") {
    std::cin >> std::noskipws;
    out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    if (std::cin.bad()) {
      return make_status(error_code::io_error, "failed to read replay from stdin");
    }
    return ok_status();
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return make_status(error_code::io_error, "cannot open replay: " + path);
  }
  out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    return make_status(error_code::io_error, "failed to read replay: " + path);
  }
  return ok_status();
}

result<replay> load_replay(std::span<const uint8_t> bytes) {
  auto log = redlog::get_logger("slpkit.stream");

  format::event_stream_reader reader(bytes);
  if (!reader.open()) {
    return result<replay>{replay{}, reader.stream_status()};
  }

  replay_builder builder;
  format::stream_event event;
  while (reader.read_next(event)) {
    auto st = builder.apply(event);
    if (!st.ok()) {
      return result<replay>{replay{}, st};
    }
  }

  const status stream_status = reader.stream_status();
  const bool truncated = stream_status.code == error_code::truncated_stream;
  if (!stream_status.ok() && (!truncated || !builder.has_start())) {
    return result<replay>{replay{}, stream_status};
  }

  std::optional<format::side_channel_metadata> side_channel;
  const auto block = reader.container().metadata;
  if (!block.empty()) {
    format::side_channel_metadata parsed;
    auto st = format::parse_side_channel(block, parsed);
    if (st.ok()) {
      side_channel = std::move(parsed);
    } else {
      format::decode_diagnostic diagnostic;
      diagnostic.kind = format::diagnostic_kind::metadata_unreadable;
      diagnostic.offset = static_cast<size_t>(block.data() - bytes.data());
      diagnostic.message = st.message;
      reader.diagnostics().push_back(std::move(diagnostic));
      log.wrn("metadata block ignored", redlog::field("error", st.message));
    }
  }

  builder.add_diagnostics(std::move(reader.diagnostics()));

  replay out;
  auto finished = builder.finish(truncated, side_channel, out);
  if (!finished.ok()) {
    return result<replay>{replay{}, finished};
  }
  if (truncated) {
    return result<replay>{std::move(out), stream_status};
  }
  return ok_result(std::move(out));
}

result<replay> load_replay_file(const std::string& path) {
  auto log = redlog::get_logger("slpkit.stream");

  std::vector<uint8_t> bytes;
  auto st = read_replay_bytes(path, bytes);
  if (!st.ok()) {
    return result<replay>{replay{}, st};
  }
  log.dbg("replay read", redlog::field("path", path), redlog::field("size", bytes.size()));
  return load_replay(bytes);
}

} // namespace slp::game

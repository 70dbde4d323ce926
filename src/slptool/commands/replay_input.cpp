#include "replay_input.hpp"

#include <cstdio>
#include <string>
#include <utility>

#include <unistd.h>

#include "slpgame/replay_loader.hpp"

namespace slptool::commands {

std::optional<slp::game::replay> load_input(const std::string& path, redlog::logger& log) {
  auto loaded = slp::game::load_replay_file(path);
  if (!loaded.ok()) {
    if (loaded.status_info.code != slp::error_code::truncated_stream) {
      log.err("failed to load replay", redlog::field("path", path),
              redlog::field("error", std::string(slp::error_code_name(loaded.status_info.code))),
              redlog::field("message", loaded.status_info.message));
      return std::nullopt;
    }
    log.wrn("replay is truncated, using the frames decoded so far", redlog::field("path", path),
            redlog::field("frames", loaded.value.frames.size()));
  }

  for (const auto& diagnostic : loaded.value.diagnostics) {
    log.dbg("decode diagnostic", redlog::field("kind", std::string(slp::format::diagnostic_kind_name(diagnostic.kind))),
            redlog::field("offset", diagnostic.offset), redlog::field("message", diagnostic.message));
  }
  log.vrb("replay loaded", redlog::field("path", path), redlog::field("version", loaded.value.version().to_string()),
          redlog::field("frames", loaded.value.frames.size()));
  return std::move(loaded.value);
}

bool stdout_is_terminal() { return isatty(fileno(stdout)) != 0; }

} // namespace slptool::commands

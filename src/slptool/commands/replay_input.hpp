#pragma once

#include <optional>
#include <string>

#include <redlog.hpp>

#include "slpgame/replay.hpp"

namespace slptool::commands {

// Loads a replay for a command. A truncated replay is accepted with a warning; any
// other failure is logged and yields nothing.
std::optional<slp::game::replay> load_input(const std::string& path, redlog::logger& log);

// true when standard output is an interactive terminal
bool stdout_is_terminal();

} // namespace slptool::commands

#pragma once

#include <string>

#include <args.hxx>

namespace slptool::commands {

/**
 * summary command - prints a human-readable overview of a replay
 *
 * @param replay_flag path to the .slp file, "-" for standard input
 * @return exit code (0 for success, 1 for failure)
 */
int summary(args::Positional<std::string>& replay_flag);

} // namespace slptool::commands

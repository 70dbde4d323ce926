#pragma once

#include <string>

#include <args.hxx>

namespace slptool::commands {

/**
 * inspect command - prints a replay, or the answers to path queries, as JSON
 *
 * @param replay_flag path to the .slp file, "-" for standard input
 * @param query_flags path queries such as `frames[].ports[0].leader.post.state` (optional)
 * @param names_flag annotate enum-like codes with their names (optional)
 * @param quiet_flag drop the query wrapper and unwrap single-element sequences (optional)
 * @param short_flag leave out the frames (optional)
 * @return exit code (0 for success, 1 for failure)
 */
int inspect(
    args::Positional<std::string>& replay_flag, args::ValueFlagList<std::string>& query_flags, args::Flag& names_flag,
    args::Flag& quiet_flag, args::Flag& short_flag
);

} // namespace slptool::commands

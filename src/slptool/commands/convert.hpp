#pragma once

#include <cstdint>
#include <string>

#include <args.hxx>

namespace slptool::commands {

/**
 * convert command - re-encodes a replay as JSON or as a columnar archive
 *
 * @param replay_flag path to the .slp file, "-" for standard input
 * @param output_flag output path; a directory or tarball for columns, "-" for standard output
 * @param format_flag json, columns or null (decode only) (optional, default columns)
 * @param container_flag dir or tar (optional, SLPKIT_CONTAINER)
 * @param compression_flag none, lz4 or zstd (optional, SLPKIT_COMPRESSION)
 * @param threads_flag column workers, 0 for one per core (optional, SLPKIT_THREADS)
 * @param short_flag leave out the frames from JSON output (optional)
 * @param names_flag annotate enum-like codes with their names (optional)
 * @return exit code (0 for success, 1 for failure, 2 for invalid options)
 */
int convert(
    args::Positional<std::string>& replay_flag, args::ValueFlag<std::string>& output_flag,
    args::ValueFlag<std::string>& format_flag, args::ValueFlag<std::string>& container_flag,
    args::ValueFlag<std::string>& compression_flag, args::ValueFlag<uint32_t>& threads_flag, args::Flag& short_flag,
    args::Flag& names_flag
);

} // namespace slptool::commands

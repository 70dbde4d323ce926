#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include "commands/convert.hpp"
#include "commands/inspect.hpp"
#include "commands/summary.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

// -v steps from warnings up to per-event tracing
void apply_verbosity() {
  constexpr std::array<redlog::level, 5> levels = {
      redlog::level::warn, redlog::level::info, redlog::level::verbose, redlog::level::debug, redlog::level::trace
  };
  const size_t step = std::min<size_t>(static_cast<size_t>(std::max(args::get(verbosity_flag), 0)), levels.size() - 1);
  redlog::set_level(levels[step]);
}
} // namespace cli

namespace {
int g_exit_code = 0;
} // namespace

void cmd_inspect(args::Subparser& parser) {
  args::Positional<std::string> replay(parser, "replay", "path to .slp file, - for stdin");
  args::ValueFlagList<std::string> queries(parser, "path", "query path, repeatable", {'q', "query"});
  args::Flag names(parser, "names", "annotate codes with their names", {'n', "names"});
  args::Flag quiet(parser, "quiet", "print bare query values", {"quiet"});
  args::Flag short_output(parser, "short", "leave out frames", {'s', "short"});
  parser.Parse();
  cli::apply_verbosity();

  g_exit_code = slptool::commands::inspect(replay, queries, names, quiet, short_output);
}

void cmd_convert(args::Subparser& parser) {
  args::Positional<std::string> replay(parser, "replay", "path to .slp file, - for stdin");
  args::ValueFlag<std::string> output(parser, "path", "output path, - for stdout", {'o', "output"});
  args::ValueFlag<std::string> format(parser, "format", "output format (json, columns, null)", {'f', "format"});
  args::ValueFlag<std::string> container(parser, "container", "archive container (dir, tar)", {"container"});
  args::ValueFlag<std::string> compression(parser, "codec", "arrow buffer compression (none, lz4, zstd)", {'c', "compression"});
  args::ValueFlag<uint32_t> threads(parser, "count", "column workers, 0 for one per core", {"threads"});
  args::Flag short_output(parser, "short", "leave out frames from json output", {'s', "short"});
  args::Flag names(parser, "names", "annotate codes with their names", {'n', "names"});
  parser.Parse();
  cli::apply_verbosity();

  g_exit_code =
      slptool::commands::convert(replay, output, format, container, compression, threads, short_output, names);
}

void cmd_summary(args::Subparser& parser) {
  args::Positional<std::string> replay(parser, "replay", "path to .slp file, - for stdin");
  parser.Parse();
  cli::apply_verbosity();

  g_exit_code = slptool::commands::summary(replay);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("slpkit - slippi replay inspector", "decode, query and convert .slp replays");
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Group commands(parser, "commands");

  args::Command inspect_cmd(commands, "inspect", "print a replay or query results as json", &cmd_inspect);
  args::Command convert_cmd(commands, "convert", "convert a replay to json or a columnar archive", &cmd_convert);
  args::Command summary_cmd(commands, "summary", "print a short overview of a replay", &cmd_summary);

  try {
    parser.ParseCLI(argc, argv);
  } catch (args::Help) {
    std::cout << parser;
  } catch (args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 2;
  }

  return g_exit_code;
}

#include "convert.hpp"

#include <fstream>
#include <iostream>

#include <redlog.hpp>

#include "slpio/replay_archive.hpp"
#include "slpquery/model_view.hpp"

#include "replay_input.hpp"
#include "tool_config.hpp"

namespace slptool::commands {

namespace {

enum class output_format { json, columns, none };

bool write_text(const std::string& path, const std::string& text, redlog::logger& log) {
  if (path == "-") {
    std::cout << text;
    std::cout.flush();
    return std::cout.good();
  }
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file) {
    log.err("cannot open output file", redlog::field("path", path));
    return false;
  }
  file << text;
  if (!file.good()) {
    log.err("failed writing output file", redlog::field("path", path));
    return false;
  }
  return true;
}

} // namespace

int convert(
    args::Positional<std::string>& replay_flag, args::ValueFlag<std::string>& output_flag,
    args::ValueFlag<std::string>& format_flag, args::ValueFlag<std::string>& container_flag,
    args::ValueFlag<std::string>& compression_flag, args::ValueFlag<uint32_t>& threads_flag, args::Flag& short_flag,
    args::Flag& names_flag
) {
  auto log = redlog::get_logger("slpkit.convert");

  if (!replay_flag) {
    log.err("replay path required");
    return 2;
  }

  output_format format = output_format::columns;
  if (format_flag) {
    const std::string name = args::get(format_flag);
    if (name == "json") {
      format = output_format::json;
    } else if (name == "columns") {
      format = output_format::columns;
    } else if (name == "null") {
      format = output_format::none;
    } else {
      log.err("unknown output format, expected json, columns or null", redlog::field("format", name));
      return 2;
    }
  }

  tool_config config = tool_config::from_environment();
  if (container_flag) {
    auto kind = parse_container(args::get(container_flag));
    if (!kind) {
      log.err("unknown container, expected dir or tar", redlog::field("container", args::get(container_flag)));
      return 2;
    }
    config.container = *kind;
  }
  if (compression_flag) {
    auto codec = parse_codec(args::get(compression_flag));
    if (!codec) {
      log.err("unknown compression, expected none, lz4 or zstd", redlog::field("compression", args::get(compression_flag)));
      return 2;
    }
    config.codec = *codec;
  }
  if (threads_flag) {
    config.threads = args::get(threads_flag);
  }

  std::string output;
  if (format != output_format::none) {
    if (!output_flag) {
      log.err("--output required");
      return 2;
    }
    output = args::get(output_flag);
    if (format == output_format::columns && output == "-") {
      if (config.container != slp::io::archive_kind::tar) {
        log.err("a directory archive cannot be written to standard output, use --container tar");
        return 2;
      }
      if (stdout_is_terminal()) {
        log.err("refusing to write a tarball to a terminal");
        return 1;
      }
    }
  }

  auto replay = load_input(args::get(replay_flag), log);
  if (!replay) {
    return 1;
  }

  slp::io::json_options json;
  json.annotate = args::get(names_flag);

  switch (format) {
  case output_format::none:
    log.inf("replay decoded", redlog::field("frames", replay->frames.size()),
            redlog::field("diagnostics", replay->diagnostics.size()));
    return 0;

  case output_format::json: {
    slp::query::view_options view;
    view.include_frames = !args::get(short_flag);
    std::string text = slp::io::dump_json(slp::query::replay_node(*replay, view), json);
    text.push_back('\n');
    return write_text(output, text, log) ? 0 : 1;
  }

  case output_format::columns: {
    slp::io::replay_archive_options options;
    options.json = json;
    options.columns.workers = config.threads;
    options.columns.codec = config.codec;
    options.columns.compression_level = config.compression_level;

    auto archive = slp::io::make_archive_writer(config.container, output);
    auto st = slp::io::write_replay_archive(*replay, options, *archive);
    if (!st.ok()) {
      log.err("failed to write archive", redlog::field("output", output),
              redlog::field("error", std::string(slp::error_code_name(st.code))), redlog::field("message", st.message));
      return 1;
    }
    log.inf("archive written", redlog::field("output", output), redlog::field("frames", replay->frames.size()));
    return 0;
  }
  }
  return 1;
}

} // namespace slptool::commands

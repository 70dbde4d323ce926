#include "inspect.hpp"

#include <iostream>
#include <vector>

#include <redlog.hpp>

#include "slpio/json_encoder.hpp"
#include "slpquery/model_view.hpp"
#include "slpquery/query_engine.hpp"

#include "replay_input.hpp"

namespace slptool::commands {

int inspect(
    args::Positional<std::string>& replay_flag, args::ValueFlagList<std::string>& query_flags, args::Flag& names_flag,
    args::Flag& quiet_flag, args::Flag& short_flag
) {
  auto log = redlog::get_logger("slpkit.inspect");

  if (!replay_flag) {
    log.err("replay path required");
    return 1;
  }

  auto replay = load_input(args::get(replay_flag), log);
  if (!replay) {
    return 1;
  }

  slp::io::json_options json;
  json.annotate = args::get(names_flag);

  slp::query::view_options view;
  view.include_frames = !args::get(short_flag);
  const auto root = slp::query::replay_node(*replay, view);

  const std::vector<std::string> queries = args::get(query_flags);
  if (queries.empty()) {
    std::cout << slp::io::dump_json(root, json) << "\n";
    return 0;
  }

  const auto results = slp::query::run_queries(root, queries);
  int exit_code = 0;
  for (const auto& entry : results) {
    if (!entry.ok()) {
      log.err("query failed", redlog::field("query", entry.query), redlog::field("segment", entry.segment),
              redlog::field("error", std::string(slp::error_code_name(entry.status_info.code))),
              redlog::field("message", entry.status_info.message));
      exit_code = 1;
    }
  }

  std::cout << slp::io::dump_json(slp::io::query_results_json(results, args::get(quiet_flag), json), json.indent) << "\n";
  return exit_code;
}

} // namespace slptool::commands

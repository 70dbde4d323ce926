#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "slpbase/result.hpp"
#include "slpformat/event_format.hpp"
#include "slpgame/labels.hpp"
#include "slpquery/node.hpp"
#include "slpquery/query_engine.hpp"

namespace slp::io {

struct json_options {
  bool annotate = false; // render labelled integers as "<code>:<LABEL>"
  const game::label_table* labels = nullptr; // builtin table when null
  int indent = 2;
};

// Keys keep declaration order; absent values are null.
nlohmann::ordered_json to_json(const query::node& value, const json_options& options);

std::string dump_json(const nlohmann::ordered_json& value, int indent);
std::string dump_json(const query::node& value, const json_options& options);

// {"<query>": value, ...}; in quiet mode single values are unwrapped and the keys dropped
nlohmann::ordered_json query_results_json(
    const std::vector<query::query_result>& results, bool quiet, const json_options& options
);

// Reads the start record back from its JSON rendering, annotated or not.
status game_start_from_json(const nlohmann::ordered_json& value, format::game_start& out);

} // namespace slp::io

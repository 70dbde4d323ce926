#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "slpbase/result.hpp"

#include "node.hpp"
#include "path.hpp"

namespace slp::query {

struct query_result {
  std::string query;
  node value;
  status status_info;
  std::string segment; // component that failed, empty on success

  bool ok() const noexcept { return status_info.ok(); }
};

// Fields on null stay null; `[]` maps the remaining steps over every element.
query_result evaluate(const node& root, const path& query);

// Parses and evaluates; a bad query only fails its own result.
query_result run_query(const node& root, std::string_view text);

std::vector<query_result> run_queries(const node& root, const std::vector<std::string>& queries);

// Replaces every single-element sequence by its element, recursively.
node unwrap_singletons(const node& value);

} // namespace slp::query

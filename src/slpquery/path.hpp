#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "slpbase/result.hpp"

namespace slp::query {

enum class step_kind { field, index, wildcard };

struct path_step {
  step_kind kind = step_kind::field;
  std::string name; // field steps
  int64_t index = 0; // index steps; negative counts from the end
  std::string component; // source component, e.g. "frames[-1]", for error messages
};

struct path {
  std::string text;
  std::vector<path_step> steps;
};

// component ('.' component)*, component := name? ('[' '-'? digits? ']')*
result<path> parse_path(std::string_view text);

} // namespace slp::query

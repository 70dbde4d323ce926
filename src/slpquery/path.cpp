#include "path.hpp"

#include <charconv>
#include <utility>

namespace slp::query {

namespace {

status invalid(std::string_view text, size_t position, const std::string& reason) {
  return make_status(
      error_code::invalid_query, "invalid query '" + std::string(text) + "' at " + std::to_string(position) + ": " + reason
  );
}

bool is_name_char(char c) { return c != '.' && c != '[' && c != ']'; }

} // namespace

result<path> parse_path(std::string_view text) {
  path out;
  out.text = std::string(text);
  if (text.empty()) {
    return result<path>{path{}, invalid(text, 0, "empty query")};
  }

  size_t pos = 0;
  while (true) {
    const size_t component_begin = pos;
    std::vector<path_step> steps;

    size_t name_end = pos;
    while (name_end < text.size() && is_name_char(text[name_end])) {
      ++name_end;
    }
    if (name_end > pos) {
      path_step step;
      step.kind = step_kind::field;
      step.name = std::string(text.substr(pos, name_end - pos));
      steps.push_back(std::move(step));
      pos = name_end;
    }

    while (pos < text.size() && text[pos] == '[') {
      const size_t close = text.find(']', pos);
      if (close == std::string_view::npos) {
        return result<path>{path{}, invalid(text, pos, "unclosed '['")};
      }
      const auto inner = text.substr(pos + 1, close - pos - 1);
      path_step step;
      if (inner.empty()) {
        step.kind = step_kind::wildcard;
      } else {
        int64_t value = 0;
        const char* first = inner.data();
        const char* last = inner.data() + inner.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last) {
          return result<path>{path{}, invalid(text, pos + 1, "bad index '" + std::string(inner) + "'")};
        }
        step.kind = step_kind::index;
        step.index = value;
      }
      steps.push_back(std::move(step));
      pos = close + 1;
    }

    if (steps.empty()) {
      return result<path>{path{}, invalid(text, pos, "empty component")};
    }
    const std::string component(text.substr(component_begin, pos - component_begin));
    for (auto& step : steps) {
      step.component = component;
      out.steps.push_back(std::move(step));
    }

    if (pos == text.size()) {
      break;
    }
    if (text[pos] != '.') {
      return result<path>{path{}, invalid(text, pos, std::string("unexpected '") + text[pos] + "'")};
    }
    ++pos;
    if (pos == text.size()) {
      return result<path>{path{}, invalid(text, pos, "trailing '.'")};
    }
  }

  return ok_result(std::move(out));
}

} // namespace slp::query

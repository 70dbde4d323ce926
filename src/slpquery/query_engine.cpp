#include "query_engine.hpp"

#include <utility>

namespace slp::query {

namespace {

struct evaluation_error {
  status status_info;
  std::string segment;
};

class evaluator {
public:
  explicit evaluator(const path& query) : query_(query) {}

  bool run(const node& current, size_t step_index, node& out) {
    if (step_index == query_.steps.size()) {
      out = current;
      return true;
    }
    const auto& step = query_.steps[step_index];

    if (current.is_null()) {
      out = node{};
      return true;
    }

    switch (step.kind) {
    case step_kind::field: {
      if (!current.is_record()) {
        return fail(error_code::no_such_field, step, "'" + step.name + "' requested from a non-record value");
      }
      const node* child = current.find(step.name);
      if (!child) {
        return fail(error_code::no_such_field, step, "no field '" + step.name + "'");
      }
      return run(*child, step_index + 1, out);
    }
    case step_kind::index: {
      if (!current.is_sequence()) {
        return fail(error_code::invalid_query, step, "index applied to a non-sequence value");
      }
      const auto size = static_cast<int64_t>(current.size());
      const int64_t resolved = step.index < 0 ? size + step.index : step.index;
      if (resolved < 0 || resolved >= size) {
        return fail(
            error_code::index_out_of_range, step,
            "index " + std::to_string(step.index) + " out of range for " + std::to_string(size) + " elements"
        );
      }
      return run(current.at(static_cast<size_t>(resolved)), step_index + 1, out);
    }
    case step_kind::wildcard: {
      if (!current.is_sequence()) {
        return fail(error_code::invalid_query, step, "wildcard applied to a non-sequence value");
      }
      std::vector<node> items;
      items.reserve(current.size());
      for (size_t i = 0; i < current.size(); ++i) {
        node item;
        if (!run(current.at(i), step_index + 1, item)) {
          return false;
        }
        items.push_back(std::move(item));
      }
      out = node::sequence(std::move(items));
      return true;
    }
    }
    return fail(error_code::invalid_query, step, "unsupported step");
  }

  const evaluation_error& error() const { return error_; }

private:
  bool fail(error_code code, const path_step& step, const std::string& reason) {
    error_.status_info = make_status(code, reason + " in '" + step.component + "'");
    error_.segment = step.component;
    return false;
  }

  const path& query_;
  evaluation_error error_{};
};

} // namespace

query_result evaluate(const node& root, const path& query) {
  query_result out;
  out.query = query.text;
  evaluator eval(query);
  if (!eval.run(root, 0, out.value)) {
    out.value = node{};
    out.status_info = eval.error().status_info;
    out.segment = eval.error().segment;
  }
  return out;
}

query_result run_query(const node& root, std::string_view text) {
  auto parsed = parse_path(text);
  if (!parsed.ok()) {
    query_result out;
    out.query = std::string(text);
    out.status_info = parsed.status_info;
    out.segment = std::string(text);
    return out;
  }
  return evaluate(root, parsed.value);
}

std::vector<query_result> run_queries(const node& root, const std::vector<std::string>& queries) {
  std::vector<query_result> out;
  out.reserve(queries.size());
  for (const auto& text : queries) {
    out.push_back(run_query(root, text));
  }
  return out;
}

node unwrap_singletons(const node& value) {
  if (!value.is_sequence()) {
    return value;
  }
  if (value.size() == 1) {
    return unwrap_singletons(value.at(0));
  }
  std::vector<node> items;
  items.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    items.push_back(unwrap_singletons(value.at(i)));
  }
  return node::sequence(std::move(items));
}

} // namespace slp::query

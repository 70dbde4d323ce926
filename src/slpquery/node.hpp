#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "slpgame/labels.hpp"

namespace slp::query {

enum class node_kind { null, boolean, integer, unsigned_integer, floating, string, sequence, record };

struct node_field;

// Read-only tree that the replay model converts into for queries and JSON output.
// Sequences may be lazy: elements are produced on access by a generator that must
// not outlive the data it reads from.
class node {
public:
  using generator = std::function<node(size_t)>;

  node() = default;

  static node boolean(bool value);
  static node integer(int64_t value, std::optional<game::label_category> label = std::nullopt);
  static node unsigned_integer(uint64_t value, std::optional<game::label_category> label = std::nullopt);
  static node floating(double value);
  static node string(std::string value);
  static node sequence(std::vector<node> items);
  static node lazy_sequence(size_t size, generator produce);
  static node record(std::vector<node_field> fields);

  node_kind kind() const { return kind_; }
  bool is_null() const { return kind_ == node_kind::null; }
  bool is_sequence() const { return kind_ == node_kind::sequence; }
  bool is_record() const { return kind_ == node_kind::record; }

  bool as_bool() const;
  int64_t as_int() const;
  uint64_t as_uint() const;
  double as_double() const;
  const std::string& as_string() const;
  const std::optional<game::label_category>& label() const { return label_; }

  size_t size() const;
  node at(size_t index) const;

  const std::vector<node_field>& fields() const;
  const node* find(std::string_view name) const;

private:
  node_kind kind_ = node_kind::null;
  std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string> scalar_{};
  std::optional<game::label_category> label_{};
  std::shared_ptr<const std::vector<node>> items_{};
  size_t lazy_size_ = 0;
  std::shared_ptr<const generator> generator_{};
  std::shared_ptr<const std::vector<node_field>> fields_{};
};

struct node_field {
  std::string name;
  node value;
};

} // namespace slp::query

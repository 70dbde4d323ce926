#include "node.hpp"

#include <utility>

namespace slp::query {

node node::boolean(bool value) {
  node out;
  out.kind_ = node_kind::boolean;
  out.scalar_ = value;
  return out;
}

node node::integer(int64_t value, std::optional<game::label_category> label) {
  node out;
  out.kind_ = node_kind::integer;
  out.scalar_ = value;
  out.label_ = label;
  return out;
}

node node::unsigned_integer(uint64_t value, std::optional<game::label_category> label) {
  node out;
  out.kind_ = node_kind::unsigned_integer;
  out.scalar_ = value;
  out.label_ = label;
  return out;
}

node node::floating(double value) {
  node out;
  out.kind_ = node_kind::floating;
  out.scalar_ = value;
  return out;
}

node node::string(std::string value) {
  node out;
  out.kind_ = node_kind::string;
  out.scalar_ = std::move(value);
  return out;
}

node node::sequence(std::vector<node> items) {
  node out;
  out.kind_ = node_kind::sequence;
  out.items_ = std::make_shared<const std::vector<node>>(std::move(items));
  return out;
}

node node::lazy_sequence(size_t size, generator produce) {
  node out;
  out.kind_ = node_kind::sequence;
  out.lazy_size_ = size;
  out.generator_ = std::make_shared<const generator>(std::move(produce));
  return out;
}

node node::record(std::vector<node_field> fields) {
  node out;
  out.kind_ = node_kind::record;
  out.fields_ = std::make_shared<const std::vector<node_field>>(std::move(fields));
  return out;
}

bool node::as_bool() const {
  const auto* value = std::get_if<bool>(&scalar_);
  return value ? *value : false;
}

int64_t node::as_int() const {
  if (const auto* value = std::get_if<int64_t>(&scalar_)) {
    return *value;
  }
  if (const auto* value = std::get_if<uint64_t>(&scalar_)) {
    return static_cast<int64_t>(*value);
  }
  return 0;
}

uint64_t node::as_uint() const {
  if (const auto* value = std::get_if<uint64_t>(&scalar_)) {
    return *value;
  }
  if (const auto* value = std::get_if<int64_t>(&scalar_)) {
    return static_cast<uint64_t>(*value);
  }
  return 0;
}

double node::as_double() const {
  if (const auto* value = std::get_if<double>(&scalar_)) {
    return *value;
  }
  if (const auto* value = std::get_if<int64_t>(&scalar_)) {
    return static_cast<double>(*value);
  }
  if (const auto* value = std::get_if<uint64_t>(&scalar_)) {
    return static_cast<double>(*value);
  }
  return 0;
}

const std::string& node::as_string() const {
  static const std::string empty;
  const auto* value = std::get_if<std::string>(&scalar_);
  return value ? *value : empty;
}

size_t node::size() const {
  if (kind_ != node_kind::sequence) {
    return 0;
  }
  return generator_ ? lazy_size_ : items_->size();
}

node node::at(size_t index) const {
  if (kind_ != node_kind::sequence || index >= size()) {
    return node{};
  }
  return generator_ ? (*generator_)(index) : (*items_)[index];
}

const std::vector<node_field>& node::fields() const {
  static const std::vector<node_field> empty;
  return fields_ ? *fields_ : empty;
}

const node* node::find(std::string_view name) const {
  if (!fields_) {
    return nullptr;
  }
  for (const auto& field : *fields_) {
    if (field.name == name) {
      return &field.value;
    }
  }
  return nullptr;
}

} // namespace slp::query

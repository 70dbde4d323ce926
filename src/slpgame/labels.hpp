#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace slp::game {

enum class label_category {
  action_state,
  character_internal,
  character_external,
  stage,
  player_type,
  end_method,
  item_type,
  hurtbox_state,
  l_cancel,
};

// Maps enum-like integer fields to display names. A missing label is not an error.
class label_table {
public:
  virtual ~label_table() = default;

  virtual std::optional<std::string_view> lookup(label_category category, uint32_t code) const = 0;
};

// names shared by every Melee build; character-specific action states are not covered
class builtin_label_table final : public label_table {
public:
  std::optional<std::string_view> lookup(label_category category, uint32_t code) const override;
};

const label_table& builtin_labels();

// "<code>:<LABEL>", or just the code when no label exists
std::string annotate(const label_table& labels, label_category category, uint32_t code);

} // namespace slp::game

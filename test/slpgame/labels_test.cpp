#include <doctest/doctest.h>

#include "slpgame/labels.hpp"

using namespace slp;

TEST_CASE("builtin labels name common codes") {
  const auto& labels = game::builtin_labels();
  CHECK(labels.lookup(game::label_category::action_state, 14) == std::optional<std::string_view>("WAIT"));
  CHECK(labels.lookup(game::label_category::action_state, 1) == std::optional<std::string_view>("DEAD_LEFT"));
  CHECK(labels.lookup(game::label_category::character_internal, 1) == std::optional<std::string_view>("FOX"));
  CHECK(labels.lookup(game::label_category::character_external, 9) == std::optional<std::string_view>("MARTH"));
  CHECK(labels.lookup(game::label_category::stage, 31) == std::optional<std::string_view>("BATTLEFIELD"));
  CHECK(labels.lookup(game::label_category::end_method, 2) == std::optional<std::string_view>("GAME"));
}

TEST_CASE("missing labels are not errors") {
  const auto& labels = game::builtin_labels();
  CHECK_FALSE(labels.lookup(game::label_category::action_state, 5000).has_value());
  CHECK_FALSE(labels.lookup(game::label_category::stage, 1000).has_value());
  CHECK(game::annotate(labels, game::label_category::action_state, 14) == "14:WAIT");
  CHECK(game::annotate(labels, game::label_category::action_state, 5000) == "5000");
}

TEST_CASE("custom label tables plug in") {
  struct single_label final : game::label_table {
    std::optional<std::string_view> lookup(game::label_category category, uint32_t code) const override {
      if (category == game::label_category::stage && code == 1) {
        return "TEST_STAGE";
      }
      return std::nullopt;
    }
  };
  single_label labels;
  CHECK(game::annotate(labels, game::label_category::stage, 1) == "1:TEST_STAGE");
  CHECK(game::annotate(labels, game::label_category::stage, 2) == "2");
}

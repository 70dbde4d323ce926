#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include <redlog.hpp>

#include "slpbase/keywords.hpp"

namespace slp::util {

// reads typed settings from PREFIX_NAME environment variables
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  template <typename enum_type>
  enum_type get_enum(
      std::initializer_list<std::pair<std::string_view, enum_type>> mapping, const std::string& name,
      enum_type default_value
  ) const;

private:
  std::string build_env_name(const std::string& name) const;
  std::string get_env_value(const std::string& name) const;
  void warn_invalid(const std::string& name, const std::string& value) const;

  std::string prefix_;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> int env_config::get<int>(const std::string& name, int default_value) const;
template <> uint32_t env_config::get<uint32_t>(const std::string& name, uint32_t default_value) const;

template <typename enum_type>
enum_type env_config::get_enum(
    std::initializer_list<std::pair<std::string_view, enum_type>> mapping, const std::string& name,
    enum_type default_value
) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }
  if (auto matched = match_keyword(value, mapping)) {
    return *matched;
  }
  warn_invalid(name, value);
  return default_value;
}

} // namespace slp::util

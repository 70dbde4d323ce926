#include "env_config.hpp"

#include <cstdlib>
#include <exception>

#include "slpbase/keywords.hpp"

namespace slp::util {

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? std::string(trim_space(value)) : std::string();
}

void env_config::warn_invalid(const std::string& name, const std::string& value) const {
  auto log = redlog::get_logger("slpkit.config");
  log.wrn("ignoring invalid environment value", redlog::field("name", build_env_name(name)),
          redlog::field("value", value));
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  auto flag = match_keyword<bool>(
      value, {{"1", true}, {"true", true}, {"yes", true}, {"on", true},
              {"0", false}, {"false", false}, {"no", false}, {"off", false}}
  );
  if (!flag) {
    warn_invalid(name, value);
    return default_value;
  }
  return *flag;
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  try {
    return std::stoi(value);
  } catch (const std::exception&) {
    warn_invalid(name, value);
    return default_value;
  }
}

template <> uint32_t env_config::get<uint32_t>(const std::string& name, uint32_t default_value) const {
  std::string value = get_env_value(name);
  if (value.empty() || value.front() == '-') {
    if (!value.empty()) {
      warn_invalid(name, value);
    }
    return default_value;
  }

  try {
    return static_cast<uint32_t>(std::stoul(value));
  } catch (const std::exception&) {
    warn_invalid(name, value);
    return default_value;
  }
}

} // namespace slp::util

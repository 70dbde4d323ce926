#include <doctest/doctest.h>

#include <cstdlib>

#include "slpbase/env_config.hpp"

namespace {

enum class sample_mode { fast, slow };

} // namespace

TEST_CASE("env_config reads prefixed typed values") {
  setenv("SLPKIT_TEST_THREADS", " 6 ", 1);
  setenv("SLPKIT_TEST_ENABLED", "yes", 1);
  setenv("SLPKIT_TEST_NAME", "columns", 1);
  setenv("SLPKIT_TEST_MODE", "slow", 1);

  slp::util::env_config config("SLPKIT_TEST");
  CHECK(config.get<uint32_t>("THREADS", 0) == 6);
  CHECK(config.get<bool>("ENABLED", false));
  CHECK(config.get<std::string>("NAME", "") == "columns");
  CHECK(config.get_enum<sample_mode>({{"fast", sample_mode::fast}, {"slow", sample_mode::slow}}, "MODE",
                                     sample_mode::fast) == sample_mode::slow);
  setenv("SLPKIT_TEST_MODE", "\tFAST\n", 1);
  CHECK(config.get_enum<sample_mode>({{"fast", sample_mode::fast}, {"slow", sample_mode::slow}}, "MODE",
                                     sample_mode::slow) == sample_mode::fast);

  unsetenv("SLPKIT_TEST_THREADS");
  unsetenv("SLPKIT_TEST_ENABLED");
  unsetenv("SLPKIT_TEST_NAME");
  unsetenv("SLPKIT_TEST_MODE");
}

TEST_CASE("env_config falls back on missing or invalid values") {
  setenv("SLPKIT_TEST_LEVEL", "loud", 1);
  setenv("SLPKIT_TEST_MODE", "medium", 1);

  slp::util::env_config config("SLPKIT_TEST_");
  CHECK(config.get<int>("LEVEL", 3) == 3);
  CHECK(config.get<int>("ABSENT", -1) == -1);
  CHECK(config.get<std::string>("ABSENT", "fallback") == "fallback");
  CHECK(config.get_enum<sample_mode>({{"fast", sample_mode::fast}}, "MODE", sample_mode::fast) == sample_mode::fast);

  unsetenv("SLPKIT_TEST_LEVEL");
  unsetenv("SLPKIT_TEST_MODE");
}

#include <doctest/doctest.h>

#include <atomic>
#include <stdexcept>
#include <vector>

#include "slpbase/worker_pool.hpp"

TEST_CASE("every index runs exactly once") {
  std::vector<std::atomic<int>> hits(257);
  slp::util::run_indexed(hits.size(), 4, [&](size_t index) { hits[index].fetch_add(1); });
  for (const auto& hit : hits) {
    CHECK(hit.load() == 1);
  }
}

TEST_CASE("a throwing task is rethrown after the workers join") {
  std::atomic<int> finished{0};
  auto task = [&](size_t index) {
    if (index == 17) {
      throw std::runtime_error("column 17 failed");
    }
    finished.fetch_add(1);
  };
  CHECK_THROWS_WITH_AS(slp::util::run_indexed(100, 4, task), "column 17 failed", std::runtime_error);
  CHECK(finished.load() < 100);

  // the serial path propagates too
  CHECK_THROWS_AS(slp::util::run_indexed(100, 1, task), std::runtime_error);
}

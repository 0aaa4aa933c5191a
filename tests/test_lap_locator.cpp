#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <f1ts/lap_locator.hpp>

using Catch::Approx;
using namespace f1ts;

static std::vector<LapBoundary> laps_of(const std::vector<std::size_t>& counts) {
  std::vector<LapBoundary> out;
  std::size_t start = 0;
  int lap = 1;
  for (std::size_t n : counts) {
    out.push_back(LapBoundary{start, start + n - 1, lap++, 90.0});
    start += n;
  }
  return out;
}

TEST_CASE("scaled boundaries are contiguous and cover the whole uniform range") {
  for (std::size_t uniform : {1u, 7u, 333u, 1000u, 10500u, 44117u}) {
    const auto laps = laps_of({13, 1, 250, 77, 9});
    const auto scaled = scale_lap_boundaries(laps, uniform);
    REQUIRE(scaled.size() == laps.size());

    std::size_t next = 0;
    for (const auto& s : scaled) {
      if (s.empty()) continue;
      REQUIRE(s.start == next);
      next = s.end + 1;
    }
    REQUIRE(next == uniform);
  }
}

TEST_CASE("lap progress stays within 0..100 for every index") {
  const auto laps = laps_of({120, 80, 200});
  LapLocator loc(laps, 5000);
  int last_lap = 1;
  for (std::size_t i = 0; i < 5000; ++i) {
    const auto c = loc.locate(i);
    REQUIRE(c.progress_pct >= 0.0);
    REQUIRE(c.progress_pct <= 100.0);
    REQUIRE(c.lap_number >= last_lap);  // laps appear in order
    last_lap = c.lap_number;
  }
  REQUIRE(last_lap == 3);
  REQUIRE(loc.total_laps() == 3);
}

TEST_CASE("indices past the table fall back to the last lap at 100 %") {
  const auto laps = laps_of({10, 10});
  LapLocator loc(laps, 100);
  const auto c = loc.locate(250);
  REQUIRE(c.lap_number == 2);
  REQUIRE(c.progress_pct == Approx(100.0));
  REQUIRE(c.lap_duration_s == Approx(90.0));
}

TEST_CASE("no laps reports lap 1 at 0 %") {
  LapLocator loc({}, 100);
  const auto c = loc.locate(5);
  REQUIRE(c.lap_number == 1);
  REQUIRE(c.progress_pct == 0.0);
  REQUIRE(c.lap_duration_s == 0.0);
}

TEST_CASE("a lap too short for one uniform tick owns no index") {
  // 1 raw sample out of 100 squeezed into 10 uniform samples
  const auto laps = laps_of({50, 1, 49});
  const auto scaled = scale_lap_boundaries(laps, 10);
  REQUIRE(scaled[0].start == 0);
  REQUIRE(scaled[0].end == 4);
  REQUIRE(scaled[1].empty());
  REQUIRE(scaled[1].length() == 0);
  REQUIRE(scaled[2].start == 5);
  REQUIRE(scaled[2].end == 9);

  LapLocator loc(laps, 10);
  REQUIRE(loc.locate(5).lap_number == 3);
}

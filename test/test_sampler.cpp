// These are tests for `ConstSampler`, `ProbabilisticSampler`, `Rate`, and the
// hashing that `ProbabilisticSampler` uses.

#include <tracewire/error.h>
#include <tracewire/rate.h>
#include <tracewire/sampler.h>
#include <tracewire/sampling_util.h>

#include <cmath>
#include <cstdint>
#include <limits>

#include "test.h"

using namespace tracewire::tracing;

#define TEST_SAMPLER(x) TEST_CASE(x, "[sampler]")

TEST_SAMPLER("Rate::from") {
  SECTION("accepts values in [0, 1]") {
    const auto value = GENERATE(0.0, 0.25, 0.5, 1.0);
    const auto rate = Rate::from(value);
    REQUIRE(rate);
    REQUIRE(rate->value() == value);
  }

  SECTION("rejects anything else") {
    const auto value =
        GENERATE(-0.001, 1.001, -1.0, 42.0, std::nan(""),
                 std::numeric_limits<double>::infinity());
    const auto rate = Rate::from(value);
    REQUIRE_FALSE(rate);
    REQUIRE(rate.error().code == Error::INVALID_SAMPLE_RATE);
  }

  SECTION("named constants") {
    REQUIRE(Rate::zero().value() == 0.0);
    REQUIRE(Rate::one().value() == 1.0);
  }
}

TEST_SAMPLER("max_id_from_rate") {
  REQUIRE(max_id_from_rate(Rate::zero()) == 0);
  REQUIRE(max_id_from_rate(Rate::one()) ==
          std::numeric_limits<std::uint64_t>::max());
  const std::uint64_t half = max_id_from_rate(*Rate::from(0.5));
  REQUIRE(half > std::numeric_limits<std::uint64_t>::max() / 2 - 4096);
  REQUIRE(half < std::numeric_limits<std::uint64_t>::max() / 2 + 4096);
}

TEST_SAMPLER("knuth_hash") {
  REQUIRE(knuth_hash(0) == 0);
  REQUIRE(knuth_hash(1) == UINT64_C(1111111111111111111));
  // Multiplication wraps around.
  REQUIRE(knuth_hash(17) == UINT64_C(1111111111111111111) * 17);
}

TEST_SAMPLER("ConstSampler") {
  const bool decision = GENERATE(true, false);
  ConstSampler sampler{decision};
  for (std::uint64_t low = 0; low < 100; ++low) {
    REQUIRE(sampler.decide(TraceID(low), "op") == decision);
    REQUIRE(sampler.decide(TraceID(low, low), "") == decision);
  }
}

TEST_SAMPLER("ProbabilisticSampler") {
  SECTION("a rate of zero drops everything") {
    ProbabilisticSampler sampler{Rate::zero()};
    for (std::uint64_t low = 0; low < 1000; ++low) {
      REQUIRE_FALSE(sampler.decide(TraceID(low), "op"));
    }
  }

  SECTION("a rate of one keeps everything") {
    ProbabilisticSampler sampler{Rate::one()};
    for (std::uint64_t low = 1; low < 1000; ++low) {
      REQUIRE(sampler.decide(TraceID(low), "op"));
    }
  }

  SECTION("decisions depend only on the lower trace ID bits") {
    ProbabilisticSampler sampler{*Rate::from(0.5)};
    for (std::uint64_t low = 0; low < 1000; ++low) {
      const bool decision = sampler.decide(TraceID(low), "op");
      REQUIRE(sampler.decide(TraceID(low), "other") == decision);
      REQUIRE(sampler.decide(TraceID(low, 12345), "op") == decision);
    }
  }

  SECTION("the kept proportion approximates the rate") {
    const double rate = GENERATE(0.1, 0.5, 0.9);
    CAPTURE(rate);
    ProbabilisticSampler sampler{*Rate::from(rate)};
    REQUIRE(sampler.rate().value() == rate);

    const int total = 100000;
    int kept = 0;
    for (int i = 0; i < total; ++i) {
      kept += sampler.decide(TraceID(std::uint64_t(i) * 7919 + 1), "op");
    }
    REQUIRE(double(kept) / total == Approx(rate).margin(0.02));
  }
}

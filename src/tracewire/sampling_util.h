#pragma once

// This component provides the arithmetic behind probabilistic sampling. An ID
// is kept if its Knuth multiplicative hash is less than a threshold derived
// from the sample rate, so that the same ID always gets the same decision.

#include <tracewire/rate.h>

#include <cstdint>
#include <limits>

namespace tracewire {
namespace tracing {

inline std::uint64_t knuth_hash(std::uint64_t value) {
  return value * UINT64_C(1111111111111111111);
}

inline std::uint64_t max_id_from_rate(Rate rate) {
  // The largest `double` less than 1.0, multiplied by the max `uint64_t`, is
  // not greater than the max `uint64_t`. So 1.0 is the only special case.
  if (rate == 1.0) {
    return std::numeric_limits<std::uint64_t>::max();
  }

  return rate * static_cast<double>(std::numeric_limits<std::uint64_t>::max());
}

}  // namespace tracing
}  // namespace tracewire

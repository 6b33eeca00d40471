#pragma once

// This component provides a function, `random_uint64`, that generates
// pseudo-random numbers for trace IDs and span IDs.
//
// Each thread draws from its own engine, seeded from `std::random_device`.
// A forked child starts with a copy of its parent's engine, so the engine of
// the forking thread is reseeded in the child. The handler that does this is
// registered with the process once, however many threads draw numbers.

#include <cstddef>
#include <cstdint>

namespace tracewire {
namespace tracing {

// Return a pseudo-random unsigned 64-bit integer uniformly distributed over
// the whole range of `std::uint64_t`. This function may be called
// concurrently without synchronization.
std::uint64_t random_uint64();

// Return how many times this component has registered its fork handler. This
// is zero before the first call to `random_uint64`, and one afterward.
std::size_t fork_handler_registrations();

}  // namespace tracing
}  // namespace tracewire

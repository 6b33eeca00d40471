#pragma once

// This component provides facilities for generating span IDs and trace IDs.
//
// `IDGenerator` is an interface for producing IDs. Tracers use
// `default_id_generator` unless another `IDGenerator` is supplied, e.g. by a
// test that needs predictable IDs.
//
// `default_id_generator` returns an `IDGenerator` backed by a thread-local
// pseudo-random sequence of uniformly distributed 64-bit unsigned integers.
// The sequence is randomly seeded once per thread and anytime the process
// forks. IDs are not checked for uniqueness; collisions are as likely as the
// birthday bound says.

#include <cstdint>
#include <memory>

#include "trace_id.h"

namespace tracewire {
namespace tracing {

class IDGenerator {
 public:
  virtual ~IDGenerator() {}

  // Return a new trace ID. Implementations must be safe to call concurrently.
  virtual TraceID trace_id() const = 0;
  // Return a new span ID. Implementations must be safe to call concurrently.
  virtual std::uint64_t span_id() const = 0;
};

// Return the default generator. If the specified `trace_id_128_bit` is true,
// then each trace ID is two independent draws (`low` and `high`); otherwise,
// a trace ID is one draw and `high` is absent.
std::shared_ptr<const IDGenerator> default_id_generator(bool trace_id_128_bit);

}  // namespace tracing
}  // namespace tracewire

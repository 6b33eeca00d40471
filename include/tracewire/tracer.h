#pragma once

// This component provides an interface, `Tracer<Context>`, that creates
// contexts for new spans and converts contexts to and from carriers.
//
// A context is created in one of two ways:
//
// - `fresh_context` starts a new trace. It draws a new trace ID and span ID,
//   and decides whether the trace is sampled: the explicit override if there
//   is one, or else the tracer's `Sampler`.
// - `child_context` continues the trace of a parent context. It draws a new
//   span ID and copies the parent's trace ID and sampling decision. The
//   `Sampler` is not consulted. Baggage is not copied from the parent.
//
// `start` chooses between the two based on the references in `SpanOptions`.
// Each implementation has its own rule for choosing the parent.
//
// The implementations are `SimpleTracer` (see `simple_tracer.h`) and
// `B3Tracer` (see `b3_tracer.h`). Both are safe to use concurrently.

#include <optional>
#include <string>
#include <string_view>

#include "dict_reader.h"
#include "dict_writer.h"
#include "expected.h"
#include "propagation.h"
#include "span_options.h"

namespace tracewire {
namespace tracing {

template <typename Context>
class Tracer {
 public:
  virtual ~Tracer() {}

  // Return the context of a new span described by the specified `options`.
  virtual Context start(const SpanOptions<Context>& options) const = 0;

  // Return the context of the first span of a new trace, whose operation has
  // the specified `operation_name`. If the specified `sampled` is present,
  // then it is the sampling decision; otherwise, the `Sampler` decides.
  virtual Context fresh_context(std::string_view operation_name,
                                std::optional<Sampled> sampled) const = 0;

  // Return the context of a new span whose parent has the specified `parent`
  // context.
  virtual Context child_context(const Context& parent) const = 0;

  // Write the specified `context` to the specified `writer` in the specified
  // carrier `format`.
  virtual void inject(const Context& context, CarrierFormat format,
                      DictWriter& writer) const = 0;

  // Return a context read from the specified `reader` in the specified carrier
  // `format`, or return an `Error` if `reader` does not contain one.
  virtual Expected<Context> extract(CarrierFormat format,
                                    const DictReader& reader) const = 0;

  // Return a JSON representation of this tracer's configuration.
  virtual std::string config() const = 0;
};

}  // namespace tracing
}  // namespace tracewire

#pragma once

// This component provides an interface, `SpanContext`, that is the identity
// of a span as far as propagation is concerned: the trace the span belongs
// to, the span itself, whether the trace is sampled, and the baggage that
// travels with it.
//
// There are two implementations: `SimpleContext` (see `simple_context.h`) and
// `B3Context` (see `b3_context.h`). They are values. A tracer never modifies a
// context that it has handed out; deriving a child produces a new context.
// Only the owner of a context value changes it, and then only its baggage.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "baggage.h"
#include "trace_id.h"

namespace tracewire {
namespace tracing {

enum class Sampled : char { NOT_SAMPLED, SAMPLED };

class SpanContext {
 public:
  virtual ~SpanContext() {}

  virtual const TraceID& trace_id() const = 0;
  virtual std::uint64_t span_id() const = 0;
  virtual bool sampled() const = 0;

  virtual const Baggage& baggage() const = 0;
  virtual void set_baggage_item(std::string key, std::string value) = 0;

  // Return the value of the baggage item having the specified `key`, or
  // return `std::nullopt` if there is no such item.
  std::optional<std::string_view> baggage_item(std::string_view key) const;

  // Return a JSON object describing this context, suitable for inclusion in
  // the serialized form of a finished span.
  virtual std::string to_json() const = 0;
};

}  // namespace tracing
}  // namespace tracewire

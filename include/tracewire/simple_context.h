#pragma once

// This component provides a class, `SimpleContext`, that is the minimal
// implementation of `SpanContext`: a 64-bit trace ID, a span ID, a sampling
// decision, and baggage. A `SimpleContext` does not know its parent span;
// parentage is carried by the references used to create it.
//
// `SimpleContext` is created by `SimpleTracer` (see `simple_tracer.h`) and is
// propagated in the "ot-tracer-*" text map format (see `propagation.h`).

#include <cstdint>
#include <string>

#include "span_context.h"

namespace tracewire {
namespace tracing {

class SimpleContext : public SpanContext {
  TraceID trace_id_;
  std::uint64_t span_id_;
  Sampled sampled_;
  Baggage baggage_;

 public:
  SimpleContext(std::uint64_t trace_id, std::uint64_t span_id, Sampled sampled,
                Baggage baggage = Baggage{});

  const TraceID& trace_id() const override;
  std::uint64_t span_id() const override;
  bool sampled() const override;
  Sampled sampled_state() const { return sampled_; }

  const Baggage& baggage() const override;
  void set_baggage_item(std::string key, std::string value) override;

  // {"trace_id": <int>, "span_id": <int>, "sampled": <bool>, "baggage": {...}}
  std::string to_json() const override;
};

bool operator==(const SimpleContext&, const SimpleContext&);
bool operator!=(const SimpleContext&, const SimpleContext&);

}  // namespace tracing
}  // namespace tracewire

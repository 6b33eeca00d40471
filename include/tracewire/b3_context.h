#pragma once

// This component provides a class, `B3Context`, that is the implementation of
// `SpanContext` compatible with Zipkin's B3 propagation. In addition to what
// `SimpleContext` has, a `B3Context` may have a 128-bit trace ID, records the
// span ID of its parent span (if any), and has a set of `B3Flags`.
//
// The sampling decision is not stored separately from the flags: `sampled()`
// is whether `flags()` contains `B3Flag::SAMPLED`, and `set_sampled` inserts
// or erases that flag.
//
// `B3Context` is created by `B3Tracer` (see `b3_tracer.h`) and is propagated
// in the "x-b3-*" format (see `propagation.h`).

#include <cstdint>
#include <optional>
#include <string>

#include "b3_flags.h"
#include "span_context.h"

namespace tracewire {
namespace tracing {

class B3Context : public SpanContext {
  TraceID trace_id_;
  std::uint64_t span_id_;
  std::optional<std::uint64_t> parent_span_id_;
  B3Flags flags_;
  Baggage baggage_;

 public:
  B3Context(const TraceID& trace_id, std::uint64_t span_id,
            std::optional<std::uint64_t> parent_span_id, B3Flags flags,
            Baggage baggage = Baggage{});

  const TraceID& trace_id() const override;
  std::uint64_t span_id() const override;
  const std::optional<std::uint64_t>& parent_span_id() const;

  B3Flags flags() const;
  bool has_flag(B3Flag flag) const;
  bool sampled() const override;
  void set_sampled(bool sampled);
  bool debug() const;

  const Baggage& baggage() const override;
  void set_baggage_item(std::string key, std::string value) override;

  // {"trace_id": <hex>, "span_id": <hex>, "parent_span_id": <hex or null>,
  //  "sampled": <bool>, "flags": [<name>...], "baggage": {...}}
  std::string to_json() const override;
};

bool operator==(const B3Context&, const B3Context&);
bool operator!=(const B3Context&, const B3Context&);

}  // namespace tracing
}  // namespace tracewire

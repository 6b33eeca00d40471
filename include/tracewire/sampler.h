#pragma once

// This component provides an interface, `Sampler`, that decides whether a new
// trace is recorded, and two implementations of it.
//
// A tracer consults its `Sampler` at most once per trace: when it creates a
// fresh (root) context without an explicit sampling override. Contexts derived
// from a parent inherit the parent's decision and never consult the `Sampler`.
//
// `ConstSampler` always returns the same decision.
//
// `ProbabilisticSampler` keeps a trace with a configured probability. The
// decision is a deterministic function of the lower 64 bits of the trace ID.

#include <string_view>

#include "rate.h"
#include "trace_id.h"

namespace tracewire {
namespace tracing {

class Sampler {
 public:
  virtual ~Sampler() {}

  // Return whether the trace having the specified `trace_id`, whose first span
  // has the specified `operation_name`, is to be recorded. Implementations
  // must be safe to call concurrently.
  virtual bool decide(const TraceID& trace_id,
                      std::string_view operation_name) = 0;
};

class ConstSampler : public Sampler {
  const bool decision_;

 public:
  explicit ConstSampler(bool decision);

  bool decide(const TraceID&, std::string_view) override;
};

class ProbabilisticSampler : public Sampler {
  const Rate rate_;

 public:
  explicit ProbabilisticSampler(Rate rate);

  bool decide(const TraceID&, std::string_view) override;

  Rate rate() const { return rate_; }
};

}  // namespace tracing
}  // namespace tracewire

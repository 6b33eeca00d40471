#pragma once

// This component provides a class, `B3Tracer`, that implements
// `Tracer<B3Context>`.
//
// `B3Tracer::start` derives the new context from the first reference in
// `SpanOptions::references` whose kind is `ReferenceKind::CHILD_OF`. If there
// is no such reference, then the new context begins a new trace, even if
// there are `FOLLOWS_FROM` references. Compare with `SimpleTracer::start`.
//
// A child context records its parent's span ID and copies all of its parent's
// flags, so a debug trace stays a debug trace.

#include <memory>

#include "b3_context.h"
#include "id_generator.h"
#include "tracer.h"
#include "tracer_config.h"

namespace tracewire {
namespace tracing {

class Logger;
class Sampler;

class B3Tracer final : public Tracer<B3Context> {
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Sampler> sampler_;
  std::shared_ptr<const IDGenerator> generator_;
  bool trace_id_128_bit_;

 public:
  explicit B3Tracer(const FinalizedTracerConfig& config);
  B3Tracer(const FinalizedTracerConfig& config,
           const std::shared_ptr<const IDGenerator>& generator);

  B3Context start(const SpanOptions<B3Context>& options) const override;
  B3Context fresh_context(std::string_view operation_name,
                          std::optional<Sampled> sampled) const override;
  B3Context child_context(const B3Context& parent) const override;

  void inject(const B3Context& context, CarrierFormat format,
              DictWriter& writer) const override;
  Expected<B3Context> extract(CarrierFormat format,
                              const DictReader& reader) const override;

  std::string config() const override;
};

}  // namespace tracing
}  // namespace tracewire

#pragma once

// This component provides a class, `SimpleTracer`, that implements
// `Tracer<SimpleContext>`.
//
// `SimpleTracer::start` derives the new context from the first reference in
// `SpanOptions::references`, whatever its kind. If there are no references,
// then the new context begins a new trace. Compare with `B3Tracer::start`.
//
// Trace IDs created by a `SimpleTracer` are always 64 bits.

#include <memory>

#include "id_generator.h"
#include "simple_context.h"
#include "tracer.h"
#include "tracer_config.h"

namespace tracewire {
namespace tracing {

class Logger;
class Sampler;

class SimpleTracer final : public Tracer<SimpleContext> {
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Sampler> sampler_;
  std::shared_ptr<const IDGenerator> generator_;

 public:
  explicit SimpleTracer(const FinalizedTracerConfig& config);
  SimpleTracer(const FinalizedTracerConfig& config,
               const std::shared_ptr<const IDGenerator>& generator);

  SimpleContext start(const SpanOptions<SimpleContext>& options) const override;
  SimpleContext fresh_context(std::string_view operation_name,
                              std::optional<Sampled> sampled) const override;
  SimpleContext child_context(const SimpleContext& parent) const override;

  void inject(const SimpleContext& context, CarrierFormat format,
              DictWriter& writer) const override;
  Expected<SimpleContext> extract(CarrierFormat format,
                                  const DictReader& reader) const override;

  std::string config() const override;
};

}  // namespace tracing
}  // namespace tracewire

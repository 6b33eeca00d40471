#include <tracewire/logger.h>
#include <tracewire/sampler.h>
#include <tracewire/simple_tracer.h>

#include <nlohmann/json.hpp>
#include <ostream>

#include "carrier_fields.h"

namespace tracewire {
namespace tracing {

SimpleTracer::SimpleTracer(const FinalizedTracerConfig& config)
    : SimpleTracer(config, default_id_generator(false)) {}

SimpleTracer::SimpleTracer(const FinalizedTracerConfig& config,
                           const std::shared_ptr<const IDGenerator>& generator)
    : logger_(config.logger),
      sampler_(config.sampler),
      generator_(generator) {
  if (config.log_on_startup) {
    logger_->log_startup([configuration = this->config()](std::ostream& log) {
      log << "TRACEWIRE SIMPLE TRACER CONFIGURATION - " << configuration;
    });
  }
}

SimpleContext SimpleTracer::start(
    const SpanOptions<SimpleContext>& options) const {
  if (options.references.empty()) {
    return fresh_context(options.operation_name, options.sampled);
  }
  return child_context(options.references.front().context);
}

SimpleContext SimpleTracer::fresh_context(
    std::string_view operation_name, std::optional<Sampled> sampled) const {
  const std::uint64_t trace_id = generator_->trace_id().low;
  const std::uint64_t span_id = generator_->span_id();
  if (!sampled) {
    sampled = sampler_->decide(TraceID(trace_id), operation_name)
                  ? Sampled::SAMPLED
                  : Sampled::NOT_SAMPLED;
  }
  return SimpleContext(trace_id, span_id, *sampled);
}

SimpleContext SimpleTracer::child_context(const SimpleContext& parent) const {
  return SimpleContext(parent.trace_id().low, generator_->span_id(),
                       parent.sampled_state());
}

void SimpleTracer::inject(const SimpleContext& context, CarrierFormat format,
                          DictWriter& writer) const {
  tracing::inject(context, format, writer);
}

Expected<SimpleContext> SimpleTracer::extract(CarrierFormat format,
                                              const DictReader& reader) const {
  return extract_simple(format, reader);
}

std::string SimpleTracer::config() const {
  auto keys = nlohmann::json::array();
  for (const CarrierField& field : ot::fields) {
    keys.push_back(std::string(field.key));
  }
  keys.push_back(std::string(Baggage::key_prefix) + "*");

  // clang-format off
  return nlohmann::json::object({
    {"context", "simple"},
    {"trace_id_128_bit", false},
    {"carrier_keys", std::move(keys)},
  }).dump();
  // clang-format on
}

}  // namespace tracing
}  // namespace tracewire

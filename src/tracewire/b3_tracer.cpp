#include <tracewire/b3_tracer.h>
#include <tracewire/logger.h>
#include <tracewire/sampler.h>

#include <algorithm>
#include <nlohmann/json.hpp>
#include <ostream>

#include "carrier_fields.h"

namespace tracewire {
namespace tracing {

B3Tracer::B3Tracer(const FinalizedTracerConfig& config)
    : B3Tracer(config, default_id_generator(config.trace_id_128_bit)) {}

B3Tracer::B3Tracer(const FinalizedTracerConfig& config,
                   const std::shared_ptr<const IDGenerator>& generator)
    : logger_(config.logger),
      sampler_(config.sampler),
      generator_(generator),
      trace_id_128_bit_(config.trace_id_128_bit) {
  if (config.log_on_startup) {
    logger_->log_startup([configuration = this->config()](std::ostream& log) {
      log << "TRACEWIRE B3 TRACER CONFIGURATION - " << configuration;
    });
  }
}

B3Context B3Tracer::start(const SpanOptions<B3Context>& options) const {
  const auto& references = options.references;
  const auto parent = std::find_if(
      references.begin(), references.end(), [](const auto& reference) {
        return reference.kind == ReferenceKind::CHILD_OF;
      });
  if (parent == references.end()) {
    return fresh_context(options.operation_name, options.sampled);
  }
  return child_context(parent->context);
}

B3Context B3Tracer::fresh_context(std::string_view operation_name,
                                  std::optional<Sampled> sampled) const {
  const TraceID trace_id = generator_->trace_id();
  const std::uint64_t span_id = generator_->span_id();
  bool keep;
  if (sampled) {
    keep = *sampled == Sampled::SAMPLED;
  } else {
    keep = sampler_->decide(trace_id, operation_name);
  }

  B3Flags flags;
  if (keep) {
    flags.insert(B3Flag::SAMPLED);
  }
  return B3Context(trace_id, span_id, std::nullopt, flags);
}

B3Context B3Tracer::child_context(const B3Context& parent) const {
  return B3Context(parent.trace_id(), generator_->span_id(), parent.span_id(),
                   parent.flags());
}

void B3Tracer::inject(const B3Context& context, CarrierFormat format,
                      DictWriter& writer) const {
  tracing::inject(context, format, writer);
}

Expected<B3Context> B3Tracer::extract(CarrierFormat format,
                                      const DictReader& reader) const {
  return extract_b3(format, reader);
}

std::string B3Tracer::config() const {
  auto keys = nlohmann::json::array();
  auto optional_keys = nlohmann::json::array();
  for (const CarrierField& field : b3::fields) {
    if (field.policy == FieldPolicy::REQUIRED) {
      keys.push_back(std::string(field.key));
    } else {
      optional_keys.push_back(std::string(field.key));
    }
  }
  optional_keys.push_back(std::string(Baggage::key_prefix) + "*");

  // clang-format off
  return nlohmann::json::object({
    {"context", "b3"},
    {"trace_id_128_bit", trace_id_128_bit_},
    {"carrier_keys", std::move(keys)},
    {"optional_carrier_keys", std::move(optional_keys)},
  }).dump();
  // clang-format on
}

}  // namespace tracing
}  // namespace tracewire

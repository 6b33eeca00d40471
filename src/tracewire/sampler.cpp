#include <tracewire/sampler.h>

#include "sampling_util.h"

namespace tracewire {
namespace tracing {

ConstSampler::ConstSampler(bool decision) : decision_(decision) {}

bool ConstSampler::decide(const TraceID&, std::string_view) {
  return decision_;
}

ProbabilisticSampler::ProbabilisticSampler(Rate rate) : rate_(rate) {}

bool ProbabilisticSampler::decide(const TraceID& trace_id, std::string_view) {
  return knuth_hash(trace_id.low) < max_id_from_rate(rate_);
}

}  // namespace tracing
}  // namespace tracewire

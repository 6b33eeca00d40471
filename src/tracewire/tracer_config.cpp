#include <tracewire/cerr_logger.h>
#include <tracewire/tracer_config.h>

namespace tracewire {
namespace tracing {

Expected<FinalizedTracerConfig> finalize_config(const TracerConfig& config) {
  FinalizedTracerConfig result;

  if (!config.sampler) {
    return Error{Error::NULL_SAMPLER,
                 "TracerConfig::sampler must not be null."};
  }
  result.sampler = config.sampler;

  if (config.logger) {
    result.logger = config.logger;
  } else {
    result.logger = std::make_shared<CerrLogger>();
  }

  result.trace_id_128_bit = config.trace_id_128_bit;
  result.log_on_startup = config.log_on_startup;

  return result;
}

}  // namespace tracing
}  // namespace tracewire

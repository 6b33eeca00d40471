#pragma once

// This component provides a `struct`, `TracerConfig`, used to configure a
// `SimpleTracer` or a `B3Tracer`, and a function, `finalize_config`, that
// validates a `TracerConfig` and applies defaults, producing a
// `FinalizedTracerConfig`. Tracers are constructed from a
// `FinalizedTracerConfig`:
//
//     TracerConfig config;
//     config.sampler = std::make_shared<ConstSampler>(true);
//     auto finalized = finalize_config(config);
//     if (auto* error = finalized.if_error()) {
//       std::cerr << *error << '\n';
//       return;
//     }
//     B3Tracer tracer{*finalized};

#include <memory>

#include "expected.h"

namespace tracewire {
namespace tracing {

class Logger;
class Sampler;

struct TracerConfig {
  // Decides whether new traces are recorded. Required.
  std::shared_ptr<Sampler> sampler;

  // Whether new trace IDs have 128 bits (`TraceID::high` is present) or 64
  // bits. Only `B3Tracer` honors this; `SimpleTracer` trace IDs are always 64
  // bits.
  bool trace_id_128_bit = true;

  // Receives diagnostics. `nullptr` means a `CerrLogger`.
  std::shared_ptr<Logger> logger;

  // Whether the tracer logs its configuration when it is constructed.
  bool log_on_startup = true;
};

class FinalizedTracerConfig {
  friend Expected<FinalizedTracerConfig> finalize_config(
      const TracerConfig& config);
  FinalizedTracerConfig() = default;

 public:
  std::shared_ptr<Sampler> sampler;
  bool trace_id_128_bit;
  std::shared_ptr<Logger> logger;
  bool log_on_startup;
};

Expected<FinalizedTracerConfig> finalize_config(const TracerConfig& config);

}  // namespace tracing
}  // namespace tracewire

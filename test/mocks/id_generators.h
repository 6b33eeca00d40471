#pragma once

#include <tracewire/id_generator.h>

#include <atomic>
#include <cstdint>

using namespace tracewire::tracing;

// `SequentialIDGenerator` produces 1, 2, 3, ... for every draw, shared between
// trace IDs and span IDs. Trace IDs have a `high` part when constructed with
// `trace_id_128_bit`.
class SequentialIDGenerator : public IDGenerator {
  mutable std::atomic<std::uint64_t> next_{1};
  const bool trace_id_128_bit_;

 public:
  explicit SequentialIDGenerator(bool trace_id_128_bit = false)
      : trace_id_128_bit_(trace_id_128_bit) {}

  TraceID trace_id() const override {
    TraceID result;
    if (trace_id_128_bit_) {
      result.high = next_++;
    }
    result.low = next_++;
    return result;
  }

  std::uint64_t span_id() const override { return next_++; }
};

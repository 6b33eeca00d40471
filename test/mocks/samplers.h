#pragma once

#include <tracewire/sampler.h>

#include <mutex>
#include <string>
#include <utility>
#include <vector>

using namespace tracewire::tracing;

// `MockSampler` returns a fixed decision and remembers every call made to it.
struct MockSampler : public Sampler {
  struct Call {
    TraceID trace_id;
    std::string operation_name;
  };

  bool decision;
  std::mutex mutex;
  std::vector<Call> calls;

  explicit MockSampler(bool decision) : decision(decision) {}

  bool decide(const TraceID& trace_id,
              std::string_view operation_name) override {
    std::lock_guard<std::mutex> lock(mutex);
    calls.push_back(Call{trace_id, std::string(operation_name)});
    return decision;
  }
};

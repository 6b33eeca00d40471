#pragma once

// This component provides the class templates that describe a request to start
// a span: `Reference<Context>`, a relationship to an existing span, and
// `SpanOptions<Context>`, the operation name, the references, and an optional
// sampling override.
//
// `Context` is `SimpleContext` or `B3Context`. See `SimpleTracer::start` and
// `B3Tracer::start` for how each tracer chooses a parent among the references.

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "span_context.h"

namespace tracewire {
namespace tracing {

enum class ReferenceKind { CHILD_OF, FOLLOWS_FROM };

template <typename Context>
struct Reference {
  ReferenceKind kind;
  Context context;

  static Reference child_of(Context context) {
    return Reference{ReferenceKind::CHILD_OF, std::move(context)};
  }

  static Reference follows_from(Context context) {
    return Reference{ReferenceKind::FOLLOWS_FROM, std::move(context)};
  }
};

template <typename Context>
struct SpanOptions {
  std::string operation_name;
  // In order of preference.
  std::vector<Reference<Context>> references;
  // If absent, the sampling decision is deferred to the tracer's `Sampler`
  // (for a new trace) or inherited (for a child).
  std::optional<Sampled> sampled;
};

}  // namespace tracing
}  // namespace tracewire

#include <tracewire/span_context.h>

namespace tracewire {
namespace tracing {

std::optional<std::string_view> SpanContext::baggage_item(
    std::string_view key) const {
  return baggage().get(key);
}

}  // namespace tracing
}  // namespace tracewire

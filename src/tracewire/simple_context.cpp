#include <tracewire/simple_context.h>

#include <nlohmann/json.hpp>

namespace tracewire {
namespace tracing {

SimpleContext::SimpleContext(std::uint64_t trace_id, std::uint64_t span_id,
                             Sampled sampled, Baggage baggage)
    : trace_id_(trace_id),
      span_id_(span_id),
      sampled_(sampled),
      baggage_(std::move(baggage)) {}

const TraceID& SimpleContext::trace_id() const { return trace_id_; }

std::uint64_t SimpleContext::span_id() const { return span_id_; }

bool SimpleContext::sampled() const { return sampled_ == Sampled::SAMPLED; }

const Baggage& SimpleContext::baggage() const { return baggage_; }

void SimpleContext::set_baggage_item(std::string key, std::string value) {
  baggage_.set(std::move(key), std::move(value));
}

std::string SimpleContext::to_json() const {
  // Baggage may hold invalid UTF-8, which is written as U+FFFD.
  // clang-format off
  return nlohmann::json::object({
    {"trace_id", trace_id_.low},
    {"span_id", span_id_},
    {"sampled", sampled()},
    {"baggage", baggage_.items()},
  }).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  // clang-format on
}

bool operator==(const SimpleContext& left, const SimpleContext& right) {
  return left.trace_id() == right.trace_id() &&
         left.span_id() == right.span_id() &&
         left.sampled_state() == right.sampled_state() &&
         left.baggage() == right.baggage();
}

bool operator!=(const SimpleContext& left, const SimpleContext& right) {
  return !(left == right);
}

}  // namespace tracing
}  // namespace tracewire

#include <tracewire/b3_context.h>

#include <nlohmann/json.hpp>

#include "hex.h"

namespace tracewire {
namespace tracing {

B3Context::B3Context(const TraceID& trace_id, std::uint64_t span_id,
                     std::optional<std::uint64_t> parent_span_id,
                     B3Flags flags, Baggage baggage)
    : trace_id_(trace_id),
      span_id_(span_id),
      parent_span_id_(parent_span_id),
      flags_(flags),
      baggage_(std::move(baggage)) {}

const TraceID& B3Context::trace_id() const { return trace_id_; }

std::uint64_t B3Context::span_id() const { return span_id_; }

const std::optional<std::uint64_t>& B3Context::parent_span_id() const {
  return parent_span_id_;
}

B3Flags B3Context::flags() const { return flags_; }

bool B3Context::has_flag(B3Flag flag) const { return flags_.contains(flag); }

bool B3Context::sampled() const { return flags_.contains(B3Flag::SAMPLED); }

void B3Context::set_sampled(bool sampled) {
  if (sampled) {
    flags_.insert(B3Flag::SAMPLED);
  } else {
    flags_.erase(B3Flag::SAMPLED);
  }
}

bool B3Context::debug() const { return flags_.contains(B3Flag::DEBUG); }

const Baggage& B3Context::baggage() const { return baggage_; }

void B3Context::set_baggage_item(std::string key, std::string value) {
  baggage_.set(std::move(key), std::move(value));
}

std::string B3Context::to_json() const {
  // Baggage may hold invalid UTF-8, which is written as U+FFFD.
  auto flag_names = nlohmann::json::array();
  for (const B3Flag flag : all_b3_flags) {
    if (flags_.contains(flag)) {
      flag_names.push_back(std::string(to_string_view(flag)));
    }
  }

  nlohmann::json parent = nullptr;
  if (parent_span_id_) {
    parent = hex_padded(*parent_span_id_);
  }

  // clang-format off
  return nlohmann::json::object({
    {"trace_id", trace_id_.hex_padded()},
    {"span_id", hex_padded(span_id_)},
    {"parent_span_id", std::move(parent)},
    {"sampled", sampled()},
    {"flags", std::move(flag_names)},
    {"baggage", baggage_.items()},
  }).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  // clang-format on
}

bool operator==(const B3Context& left, const B3Context& right) {
  return left.trace_id() == right.trace_id() &&
         left.span_id() == right.span_id() &&
         left.parent_span_id() == right.parent_span_id() &&
         left.flags() == right.flags() && left.baggage() == right.baggage();
}

bool operator!=(const B3Context& left, const B3Context& right) {
  return !(left == right);
}

}  // namespace tracing
}  // namespace tracewire

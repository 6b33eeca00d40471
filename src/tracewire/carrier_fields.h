#pragma once

// This component provides the table of reserved carrier keys used by
// `propagation.cpp`, together with each key's decoding policy, and a function
// template, `read_field`, that applies the policy.
//
// A field is either `FieldPolicy::REQUIRED`, in which case a missing or
// malformed value means that no context can be extracted, or
// `FieldPolicy::DEFAULT_ON_ERROR`, in which case a missing or malformed value
// is silently replaced by the field's default.

#include <tracewire/dict_reader.h>
#include <tracewire/expected.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parse_util.h"

namespace tracewire {
namespace tracing {

enum class FieldPolicy { REQUIRED, DEFAULT_ON_ERROR };

struct CarrierField {
  std::string_view key;
  FieldPolicy policy;
};

// `SimpleContext` fields.
namespace ot {

constexpr CarrierField trace_id{"ot-tracer-traceid", FieldPolicy::REQUIRED};
constexpr CarrierField span_id{"ot-tracer-spanid", FieldPolicy::REQUIRED};
constexpr CarrierField sampled{"ot-tracer-sampled", FieldPolicy::REQUIRED};

constexpr CarrierField fields[] = {trace_id, span_id, sampled};

}  // namespace ot

// `B3Context` fields.
namespace b3 {

// clang-format off
constexpr CarrierField trace_id{"x-b3-traceid", FieldPolicy::REQUIRED};
constexpr CarrierField span_id{"x-b3-spanid", FieldPolicy::REQUIRED};
constexpr CarrierField parent_span_id{"x-b3-parentspanid", FieldPolicy::DEFAULT_ON_ERROR};
constexpr CarrierField sampled{"x-b3-sampled", FieldPolicy::DEFAULT_ON_ERROR};
constexpr CarrierField flags{"x-b3-flags", FieldPolicy::DEFAULT_ON_ERROR};
// clang-format on

constexpr CarrierField fields[] = {trace_id, span_id, parent_span_id, sampled,
                                   flags};

}  // namespace b3

// `FieldErrors` accumulates the failures of required fields so that one
// extraction reports all of them at once.
class FieldErrors {
  std::vector<Error> errors_;

 public:
  void add(Error error) { errors_.push_back(std::move(error)); }
  bool empty() const { return errors_.empty(); }

  // Return a single `Error::MALFORMED_CARRIER` whose message lists every
  // accumulated failure.
  Error combined(std::string_view format_name) const {
    std::string message;
    message += "Unable to extract a context from ";
    append(message, format_name);
    message += ": ";
    for (std::size_t i = 0; i < errors_.size(); ++i) {
      if (i != 0) {
        message += "; ";
      }
      message += errors_[i].message;
    }
    return Error{Error::MALFORMED_CARRIER, std::move(message)};
  }
};

// Look up the specified `field` in the specified `carrier` and parse it using
// the specified `parse`, which is a function `std::string_view ->
// Expected<Value>`. Return the parsed value. If the value is missing or
// unparsable, then either add a diagnostic to the specified `errors` (for a
// required field) or ignore the failure (for any other field), and return
// `std::nullopt`.
template <typename Parse>
auto read_field(const DictReader& carrier, const CarrierField& field,
                Parse&& parse, FieldErrors& errors)
    -> std::optional<
        typename decltype(parse(std::string_view{}))::ValueType> {
  const auto found = carrier.lookup(field.key);
  if (!found) {
    if (field.policy == FieldPolicy::REQUIRED) {
      std::string message;
      message += "missing required key \"";
      append(message, field.key);
      message += '\"';
      errors.add(Error{Error::MALFORMED_CARRIER, std::move(message)});
    }
    return std::nullopt;
  }

  auto result = parse(*found);
  if (auto* error = result.if_error()) {
    if (field.policy == FieldPolicy::REQUIRED) {
      std::string prefix;
      prefix += "malformed value for key \"";
      append(prefix, field.key);
      prefix += "\": ";
      errors.add(error->with_prefix(prefix));
    }
    return std::nullopt;
  }

  return std::move(*result);
}

}  // namespace tracing
}  // namespace tracewire

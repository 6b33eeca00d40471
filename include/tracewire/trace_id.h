#pragma once

// This component provides a `struct`, `TraceID`, that identifies every span of
// one trace.  A trace ID is either 64 bits (`low` only) or 128 bits (`low` and
// `high`).  Whether `high` is present is part of the value: a 128-bit trace ID
// whose high bits are zero is not equal to the 64-bit trace ID having the same
// low bits, and the two are formatted differently by `hex_padded`.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "expected.h"

namespace tracewire {
namespace tracing {

struct TraceID {
  std::uint64_t low;
  std::optional<std::uint64_t> high;

  TraceID();
  explicit TraceID(std::uint64_t low);
  TraceID(std::uint64_t low, std::uint64_t high);

  // Return the zero-padded lower-case hexadecimal form of this trace ID: 32
  // characters (`high` followed by `low`) if `high` is present, or 16
  // characters otherwise.
  std::string hex_padded() const;

  // Return the decimal form of `low`.
  std::string low_dec() const;

  // Return a trace ID parsed from the specified `input`, which must be either
  // 16 or 32 hexadecimal characters. A 32 character `input` produces a trace ID
  // whose `high` is present, even if zero.
  static Expected<TraceID> parse_hex(std::string_view input);
};

bool operator==(const TraceID&, const TraceID&);
bool operator!=(const TraceID&, const TraceID&);

}  // namespace tracing
}  // namespace tracewire

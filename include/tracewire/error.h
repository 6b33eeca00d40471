#pragma once

// This component provides a `struct`, `Error`, that contains an error code and
// a diagnostic message.  `Error` is the failure alternative of `Expected`, see
// `expected.h`.

#include <iosfwd>
#include <string>
#include <string_view>

namespace tracewire {
namespace tracing {

struct Error {
  // Don't change the numeric values; they appear in diagnostics.
  enum Code {
    MALFORMED_CARRIER = 1,
    INVALID_INTEGER = 2,
    OUT_OF_RANGE_INTEGER = 3,
    INVALID_HEX_WIDTH = 4,
    NULL_SAMPLER = 5,
    INVALID_SAMPLE_RATE = 6,
  };

  Code code;
  std::string message;

  std::string to_string() const;
  // Return a copy of this error whose `message` begins with the specified
  // `prefix`.
  Error with_prefix(std::string_view prefix) const;
};

std::ostream& operator<<(std::ostream&, const Error&);

}  // namespace tracing
}  // namespace tracewire

#pragma once

// This component provides functions for formatting an integral value in
// hexadecimal.

#include <cassert>
#include <charconv>
#include <iterator>
#include <limits>
#include <string>
#include <system_error>

namespace tracewire {
namespace tracing {

// Return the specified `value` formatted as a lower-case hexadecimal string
// without any leading zeroes.
template <typename Integer>
std::string hex(Integer value) {
  // 4 bits per hex digit char, and then +1 char for possible minus sign
  char buffer[std::numeric_limits<Integer>::digits / 4 + 1];

  const int base = 16;
  auto result =
      std::to_chars(std::begin(buffer), std::end(buffer), value, base);
  assert(result.ec == std::errc());

  return std::string{std::begin(buffer), result.ptr};
}

// Return the specified `value` formatted as a lower-case hexadecimal string,
// zero-padded on the left to the natural width of `Integer`, e.g. 16
// characters for `std::uint64_t`.
template <typename Integer>
std::string hex_padded(Integer value) {
  const std::size_t width = std::numeric_limits<Integer>::digits / 4;
  std::string result = hex(value);
  if (result.size() < width) {
    result.insert(0, width - result.size(), '0');
  }
  return result;
}

}  // namespace tracing
}  // namespace tracewire

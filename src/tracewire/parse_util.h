#pragma once

// This component provides parsing-related miscellanea.

#include <tracewire/expected.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace tracewire {
namespace tracing {

// Return a non-negative integer parsed from the specified `input` with respect
// to the specified `base`, or return an `Error` if no such integer can be
// parsed. It is an error unless all of `input` is consumed by the parse.
// Leading and trailing whitespace are not ignored.
Expected<std::uint64_t> parse_uint64(std::string_view input, int base);

// Return an integer parsed from the specified `input`, which must be exactly
// 16 hexadecimal characters, i.e. a zero-padded 64-bit value. Return an
// `Error` if `input` has a different length or is not hexadecimal.
Expected<std::uint64_t> parse_padded_hex_uint64(std::string_view input);

// Return whether the specified `prefix` is a prefix of the specified `subject`.
bool starts_with(std::string_view subject, std::string_view prefix);

// Convert the specified `text` to lower case in-place.
void to_lower(std::string& text);

// Append the specified `text` to the specified `destination`.
inline void append(std::string& destination, std::string_view text) {
  destination.append(text.data(), text.size());
}

}  // namespace tracing
}  // namespace tracewire

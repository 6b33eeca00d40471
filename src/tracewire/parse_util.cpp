#include "parse_util.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace tracewire {
namespace tracing {
namespace {

template <typename Integer>
Expected<Integer> parse_integer(std::string_view input, int base,
                                std::string_view kind) {
  Integer value;
  const char* const begin = input.data();
  const char* const end = begin + input.size();
  const auto status = std::from_chars(begin, end, value, base);
  if (status.ec == std::errc::invalid_argument) {
    std::string message;
    message += "Is not a valid integer: \"";
    append(message, input);
    message += '\"';
    return Error{Error::INVALID_INTEGER, std::move(message)};
  } else if (status.ptr != end) {
    std::string message;
    message += "Integer has trailing characters in: \"";
    append(message, input);
    message += '\"';
    return Error{Error::INVALID_INTEGER, std::move(message)};
  } else if (status.ec == std::errc::result_out_of_range) {
    std::string message;
    message += "Integer is not within the range of ";
    append(message, kind);
    message += ": ";
    append(message, input);
    return Error{Error::OUT_OF_RANGE_INTEGER, std::move(message)};
  }
  return value;
}

}  // namespace

Expected<std::uint64_t> parse_uint64(std::string_view input, int base) {
  return parse_integer<std::uint64_t>(input, base, "64-bit unsigned");
}

Expected<std::uint64_t> parse_padded_hex_uint64(std::string_view input) {
  if (input.size() != 16) {
    std::string message;
    message += "Expected 16 hexadecimal characters, but \"";
    append(message, input);
    message += "\" has ";
    message += std::to_string(input.size());
    message += '.';
    return Error{Error::INVALID_HEX_WIDTH, std::move(message)};
  }
  return parse_uint64(input, 16);
}

bool starts_with(std::string_view subject, std::string_view prefix) {
  if (prefix.size() > subject.size()) {
    return false;
  }

  return std::mismatch(prefix.begin(), prefix.end(), subject.begin()).first ==
         prefix.end();
}

void to_lower(std::string& text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
}

}  // namespace tracing
}  // namespace tracewire

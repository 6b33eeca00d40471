#include <tracewire/trace_id.h>

#include "hex.h"
#include "parse_util.h"

namespace tracewire {
namespace tracing {

TraceID::TraceID() : low(0) {}

TraceID::TraceID(std::uint64_t low) : low(low) {}

TraceID::TraceID(std::uint64_t low, std::uint64_t high)
    : low(low), high(high) {}

std::string TraceID::hex_padded() const {
  std::string result;
  if (high) {
    result += ::tracewire::tracing::hex_padded(*high);
  }
  result += ::tracewire::tracing::hex_padded(low);
  return result;
}

std::string TraceID::low_dec() const { return std::to_string(low); }

Expected<TraceID> TraceID::parse_hex(std::string_view input) {
  const auto parse_hex_piece =
      [&](std::string_view piece) -> Expected<std::uint64_t> {
    auto result = parse_uint64(piece, 16);
    if (auto* error = result.if_error()) {
      std::string prefix = "Unable to parse trace ID from \"";
      append(prefix, input);
      prefix += "\": ";
      return error->with_prefix(prefix);
    }
    return result;
  };

  if (input.size() == 16) {
    auto result = parse_hex_piece(input);
    if (auto* error = result.if_error()) {
      return std::move(*error);
    }
    return TraceID(*result);
  }

  if (input.size() != 32) {
    std::string message;
    message += "A hexadecimal trace ID must be 16 or 32 characters long, but \"";
    append(message, input);
    message += "\" has ";
    message += std::to_string(input.size());
    message += '.';
    return Error{Error::INVALID_HEX_WIDTH, std::move(message)};
  }

  // Parse the higher part and the lower part separately.
  auto high = parse_hex_piece(input.substr(0, 16));
  if (auto* error = high.if_error()) {
    return std::move(*error);
  }
  auto low = parse_hex_piece(input.substr(16));
  if (auto* error = low.if_error()) {
    return std::move(*error);
  }

  return TraceID(*low, *high);
}

bool operator==(const TraceID& left, const TraceID& right) {
  return left.low == right.low && left.high == right.high;
}

bool operator!=(const TraceID& left, const TraceID& right) {
  return !(left == right);
}

}  // namespace tracing
}  // namespace tracewire

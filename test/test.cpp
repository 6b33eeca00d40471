#include "test.h"

#include <ostream>

namespace std {

std::ostream& operator<<(std::ostream& stream,
                         const std::pair<const std::string, std::string>& item) {
  return stream << '{' << item.first << ", " << item.second << '}';
}

std::ostream& operator<<(
    std::ostream& stream,
    const std::unordered_map<std::string, std::string>& items) {
  stream << '{';
  for (const auto& item : items) {
    stream << ' ' << item;
  }
  return stream << " }";
}

}  // namespace std

namespace tracewire {
namespace tracing {

std::ostream& operator<<(std::ostream& stream, const TraceID& trace_id) {
  return stream << "0x" << trace_id.hex_padded();
}

std::ostream& operator<<(std::ostream& stream, const SimpleContext& context) {
  return stream << context.to_json();
}

std::ostream& operator<<(std::ostream& stream, const B3Context& context) {
  return stream << context.to_json();
}

}  // namespace tracing
}  // namespace tracewire

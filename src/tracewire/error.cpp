#include <tracewire/error.h>

#include <ostream>
#include <sstream>

namespace tracewire {
namespace tracing {

std::ostream& operator<<(std::ostream& stream, const Error& error) {
  return stream << "[tracewire error code " << int(error.code) << "] "
                << error.message;
}

std::string Error::to_string() const {
  std::ostringstream stream;
  stream << *this;
  return stream.str();
}

Error Error::with_prefix(std::string_view prefix) const {
  Error result{code, std::string(prefix)};
  result.message += message;
  return result;
}

}  // namespace tracing
}  // namespace tracewire

#include <tracewire/error.h>
#include <tracewire/logger.h>

#include <ostream>

namespace tracewire {
namespace tracing {

void Logger::log_error(const Error& error) {
  log_error([&](std::ostream& log) { log << error; });
}

void Logger::log_error(std::string_view message) {
  log_error([&](std::ostream& log) { log << message; });
}

}  // namespace tracing
}  // namespace tracewire

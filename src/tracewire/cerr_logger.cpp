#include <tracewire/cerr_logger.h>

#include <iostream>

namespace tracewire {
namespace tracing {

void CerrLogger::log_error(const LogFunc& write) { log(write); }

void CerrLogger::log_startup(const LogFunc& write) { log(write); }

void CerrLogger::log(const LogFunc& write) {
  std::lock_guard<std::mutex> lock(mutex_);
  write(stream_);
  stream_ << '\n';
  std::cerr << stream_.str();
  stream_.str("");
}

}  // namespace tracing
}  // namespace tracewire

#pragma once

// This component provides a class, `CerrLogger`, that implements the `Logger`
// interface by writing each message as one line to `std::cerr`. Messages from
// concurrent callers are not interleaved.

#include <mutex>
#include <sstream>

#include "logger.h"

namespace tracewire {
namespace tracing {

class CerrLogger : public Logger {
  std::mutex mutex_;
  std::ostringstream stream_;

 public:
  void log_error(const LogFunc&) override;
  void log_startup(const LogFunc&) override;
  using Logger::log_error;  // expose the other overloads

 private:
  void log(const LogFunc&);
};

}  // namespace tracing
}  // namespace tracewire

#pragma once

// This component provides an interface, `Logger`, that allows for the
// customization of how tracers log diagnostic and startup messages.
//
// Diagnostics are passed to the `Logger` as a function that writes to an
// `std::ostream`, so that a `Logger` that drops messages never pays for
// formatting them.
//
// The default `Logger` is `CerrLogger`, which writes to `std::cerr`.

#include <functional>
#include <iosfwd>
#include <string_view>

namespace tracewire {
namespace tracing {

struct Error;

class Logger {
 public:
  using LogFunc = std::function<void(std::ostream&)>;

  virtual ~Logger() {}

  virtual void log_error(const LogFunc&) = 0;
  virtual void log_startup(const LogFunc&) = 0;

  virtual void log_error(const Error&);
  virtual void log_error(std::string_view);
};

}  // namespace tracing
}  // namespace tracewire

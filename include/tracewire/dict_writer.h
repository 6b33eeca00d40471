#pragma once

// This component provides an interface, `DictWriter`, that represents a
// write-only key/value mapping of strings.  It's used when injecting trace
// context into a carrier: a text map, HTTP headers, etc.

#include <string_view>

namespace tracewire {
namespace tracing {

class DictWriter {
 public:
  virtual ~DictWriter() {}

  // Associate the specified `value` with the specified `key`.  An
  // implementation may, but is not required to, overwrite any previous value
  // at `key`.
  virtual void set(std::string_view key, std::string_view value) = 0;
};

}  // namespace tracing
}  // namespace tracewire

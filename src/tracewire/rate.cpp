#include <tracewire/rate.h>

#include <string>

namespace tracewire {
namespace tracing {

Expected<Rate> Rate::from(double value) {
  // The negated comparison also rejects NaN.
  if (!(value >= 0.0 && value <= 1.0)) {
    std::string message;
    message += "A rate must be within [0.0, 1.0], but ";
    message += std::to_string(value);
    message += " is not.";
    return Error{Error::INVALID_SAMPLE_RATE, std::move(message)};
  }
  return Rate(value);
}

}  // namespace tracing
}  // namespace tracewire

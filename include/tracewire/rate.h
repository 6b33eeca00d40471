#pragma once

// This component provides a class, `Rate`, that is a probability: a number in
// the range [0, 1]. The only way to construct a `Rate` other than zero or one
// is `Rate::from`, which validates its argument.

#include "expected.h"

namespace tracewire {
namespace tracing {

class Rate {
  double value_;
  explicit Rate(double value) : value_(value) {}

 public:
  Rate() : value_(0.0) {}

  double value() const { return value_; }
  operator double() const { return value(); }

  static Rate one() { return Rate(1.0); }
  static Rate zero() { return Rate(0.0); }

  static Expected<Rate> from(double);
};

}  // namespace tracing
}  // namespace tracewire

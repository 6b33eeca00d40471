#pragma once

// This component provides an enumeration, `B3Flag`, and a class, `B3Flags`,
// that is a set of `B3Flag` values represented as a bitmask.
//
// `B3Context` (see `b3_context.h`) stores its sampling decision as membership
// of `B3Flag::SAMPLED` in its `B3Flags`, and whether the trace is being
// debugged as membership of `B3Flag::DEBUG`.

#include <cstdint>
#include <initializer_list>
#include <string_view>

namespace tracewire {
namespace tracing {

enum class B3Flag : std::uint8_t {
  DEBUG = 1 << 0,
  SAMPLING_SET = 1 << 1,
  SAMPLED = 1 << 2,
  IS_ROOT = 1 << 3,
};

std::string_view to_string_view(B3Flag);

class B3Flags {
  std::uint8_t bits_;

 public:
  B3Flags() : bits_(0) {}
  B3Flags(std::initializer_list<B3Flag> flags);

  bool contains(B3Flag flag) const;
  void insert(B3Flag flag);
  void erase(B3Flag flag);
  bool empty() const { return bits_ == 0; }
  std::uint8_t bits() const { return bits_; }

  bool operator==(B3Flags other) const { return bits_ == other.bits_; }
  bool operator!=(B3Flags other) const { return bits_ != other.bits_; }
};

// Every `B3Flag`, in order of increasing bit value.
constexpr B3Flag all_b3_flags[] = {B3Flag::DEBUG, B3Flag::SAMPLING_SET,
                                   B3Flag::SAMPLED, B3Flag::IS_ROOT};

}  // namespace tracing
}  // namespace tracewire

#include <tracewire/b3_flags.h>

namespace tracewire {
namespace tracing {

std::string_view to_string_view(B3Flag flag) {
  switch (flag) {
    case B3Flag::DEBUG:
      return "debug";
    case B3Flag::SAMPLING_SET:
      return "sampling_set";
    case B3Flag::SAMPLED:
      return "sampled";
    case B3Flag::IS_ROOT:
      return "is_root";
  }
  return "unknown";
}

B3Flags::B3Flags(std::initializer_list<B3Flag> flags) : bits_(0) {
  for (const B3Flag flag : flags) {
    insert(flag);
  }
}

bool B3Flags::contains(B3Flag flag) const {
  return (bits_ & static_cast<std::uint8_t>(flag)) != 0;
}

void B3Flags::insert(B3Flag flag) { bits_ |= static_cast<std::uint8_t>(flag); }

void B3Flags::erase(B3Flag flag) {
  bits_ &= static_cast<std::uint8_t>(~static_cast<std::uint8_t>(flag));
}

}  // namespace tracing
}  // namespace tracewire

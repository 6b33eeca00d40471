#pragma once

// This component provides a class, `Baggage`, that is the set of key/value
// pairs propagated alongside a trace context across process boundaries.
//
// On the wire, each item is one carrier entry whose key is the item's key
// prefixed by `Baggage::key_prefix`. See `propagation.h`.

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tracewire {
namespace tracing {

class Baggage {
  std::unordered_map<std::string, std::string> items_;

 public:
  // Carrier keys beginning with this prefix are baggage items.
  static constexpr std::string_view key_prefix = "ot-baggage-";

  Baggage() = default;
  explicit Baggage(std::unordered_map<std::string, std::string> items);

  // Return whether there is an item having the specified `key`.
  bool contains(std::string_view key) const;

  // Return the value of the item having the specified `key`, or return
  // `std::nullopt` if there is no such item.
  std::optional<std::string_view> get(std::string_view key) const;

  // Set the item having the specified `key` to the specified `value`,
  // overwriting any previous value.
  void set(std::string key, std::string value);

  // Remove the item having the specified `key`, if any.
  void remove(std::string_view key);

  std::size_t size() const;
  bool empty() const;

  // Invoke the specified `visitor` once for each item.
  void visit(const std::function<void(std::string_view key,
                                      std::string_view value)>& visitor) const;

  const std::unordered_map<std::string, std::string>& items() const {
    return items_;
  }

  bool operator==(const Baggage& other) const { return items_ == other.items_; }
  bool operator!=(const Baggage& other) const { return items_ != other.items_; }
};

}  // namespace tracing
}  // namespace tracewire

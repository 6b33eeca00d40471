#include <tracewire/baggage.h>

namespace tracewire {
namespace tracing {

Baggage::Baggage(std::unordered_map<std::string, std::string> items)
    : items_(std::move(items)) {}

bool Baggage::contains(std::string_view key) const {
  return items_.find(std::string(key)) != items_.end();
}

std::optional<std::string_view> Baggage::get(std::string_view key) const {
  const auto found = items_.find(std::string(key));
  if (found == items_.end()) {
    return std::nullopt;
  }
  return found->second;
}

void Baggage::set(std::string key, std::string value) {
  items_.insert_or_assign(std::move(key), std::move(value));
}

void Baggage::remove(std::string_view key) { items_.erase(std::string(key)); }

std::size_t Baggage::size() const { return items_.size(); }

bool Baggage::empty() const { return items_.empty(); }

void Baggage::visit(const std::function<void(std::string_view key,
                                             std::string_view value)>& visitor)
    const {
  for (const auto& [key, value] : items_) {
    visitor(key, value);
  }
}

}  // namespace tracing
}  // namespace tracewire

#pragma once

// This component provides a class template, `Expected<Value>`, that holds
// either a `Value` or an `Error`.  It is how fallible operations in this
// library report failure, e.g. extracting a context from a carrier.
//
//     Expected<SimpleContext> context = tracer.extract(format, headers);
//     if (auto* error = context.if_error()) {
//       logger.log_error(*error);
//       return;
//     }
//     use(*context);

#include <utility>
#include <variant>

#include "error.h"

namespace tracewire {
namespace tracing {

template <typename Value>
class Expected {
  std::variant<Value, Error> data_;

 public:
  using ValueType = Value;

  Expected() = default;
  Expected(const Expected&) = default;
  Expected(Expected&) = default;
  Expected(Expected&&) = default;
  Expected& operator=(const Expected&) = default;
  Expected& operator=(Expected&&) = default;

  template <typename Other>
  Expected(Other&&);
  template <typename Other>
  Expected& operator=(Other&&);

  bool has_value() const noexcept;
  explicit operator bool() const noexcept;

  Value& value() &;
  const Value& value() const&;
  Value&& value() &&;

  Value& operator*() &;
  const Value& operator*() const&;
  Value&& operator*() &&;

  Value* operator->();
  const Value* operator->() const;

  Error& error() &;
  const Error& error() const&;
  Error&& error() &&;

  // Return a pointer to the `Error` if there is one, or `nullptr` otherwise.
  Error* if_error() &;
  const Error* if_error() const&;
  // Don't use `if_error` on an rvalue (temporary).
  Error* if_error() && = delete;
  const Error* if_error() const&& = delete;
};

template <typename Value>
template <typename Other>
Expected<Value>::Expected(Other&& other) : data_(std::forward<Other>(other)) {}

template <typename Value>
template <typename Other>
Expected<Value>& Expected<Value>::operator=(Other&& other) {
  data_ = std::forward<Other>(other);
  return *this;
}

template <typename Value>
bool Expected<Value>::has_value() const noexcept {
  return std::holds_alternative<Value>(data_);
}

template <typename Value>
Expected<Value>::operator bool() const noexcept {
  return has_value();
}

template <typename Value>
Value& Expected<Value>::value() & {
  return std::get<0>(data_);
}
template <typename Value>
const Value& Expected<Value>::value() const& {
  return std::get<0>(data_);
}
template <typename Value>
Value&& Expected<Value>::value() && {
  return std::move(std::get<0>(data_));
}

template <typename Value>
Value& Expected<Value>::operator*() & {
  return value();
}
template <typename Value>
const Value& Expected<Value>::operator*() const& {
  return value();
}
template <typename Value>
Value&& Expected<Value>::operator*() && {
  return std::move(value());
}

template <typename Value>
Value* Expected<Value>::operator->() {
  return &value();
}
template <typename Value>
const Value* Expected<Value>::operator->() const {
  return &value();
}

template <typename Value>
Error& Expected<Value>::error() & {
  return std::get<1>(data_);
}
template <typename Value>
const Error& Expected<Value>::error() const& {
  return std::get<1>(data_);
}
template <typename Value>
Error&& Expected<Value>::error() && {
  return std::move(std::get<1>(data_));
}

template <typename Value>
Error* Expected<Value>::if_error() & {
  return std::get_if<1>(&data_);
}
template <typename Value>
const Error* Expected<Value>::if_error() const& {
  return std::get_if<1>(&data_);
}

}  // namespace tracing
}  // namespace tracewire

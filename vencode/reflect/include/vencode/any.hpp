#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>

#include "vencode/value-ref.hpp"

namespace vencode {

template <class T>
const TypeInfo &TypeInfoFor();

namespace internal {
std::type_index TypeIdOf(const TypeInfo &type) noexcept;
}  // namespace internal

// Owning, immutable, dynamically typed value: the interface kind of the encoder.
// Copies share the held value. A default constructed Any is nil.
class Any {
 public:
  Any() noexcept = default;

  Any(std::nullptr_t) noexcept {}

  Any(const char *str) : Any(std::string(str)) {}

  template <class T>
    requires(!std::same_as<std::remove_cvref_t<T>, Any> && !std::same_as<std::remove_cvref_t<T>, std::nullptr_t> &&
             !std::same_as<std::decay_t<T>, const char *> && !std::same_as<std::decay_t<T>, char *>)
  Any(T &&value)
      : _type(&TypeInfoFor<std::decay_t<T>>()),
        _value(std::make_shared<const std::decay_t<T>>(std::forward<T>(value))) {}

  [[nodiscard]] bool isNil() const noexcept { return _value == nullptr; }

  [[nodiscard]] const TypeInfo *type() const noexcept { return _type; }

  [[nodiscard]] ValueRef ref() const noexcept {
    return _value == nullptr ? ValueRef{} : ValueRef(*_type, _value.get(), false);
  }

  // Returns the held value if it is exactly of type T, nullptr otherwise.
  template <class T>
  [[nodiscard]] const T *get() const noexcept {
    if (_value == nullptr || internal::TypeIdOf(*_type) != std::type_index(typeid(T))) {
      return nullptr;
    }
    return static_cast<const T *>(_value.get());
  }

 private:
  const TypeInfo *_type{nullptr};
  std::shared_ptr<const void> _value;
};

}  // namespace vencode

#pragma once

#include "vencode/kind.hpp"

namespace vencode {

struct TypeInfo;

// Non-owning, typed view of a value: its type descriptor, its address and whether the viewed object may be
// mutated (the C++ counterpart of an addressable value). A default constructed ValueRef holds no value and
// encodes as nil.
class ValueRef {
 public:
  ValueRef() noexcept = default;

  ValueRef(const TypeInfo &type, const void *ptr, bool addressable = false) noexcept
      : _type(&type), _ptr(ptr), _addressable(addressable) {}

  [[nodiscard]] bool valid() const noexcept { return _ptr != nullptr; }

  [[nodiscard]] const TypeInfo *type() const noexcept { return _type; }

  [[nodiscard]] const void *ptr() const noexcept { return _ptr; }

  [[nodiscard]] bool addressable() const noexcept { return _addressable; }

  // Kind::Invalid when no value is held.
  [[nodiscard]] Kind kind() const noexcept;

  // Pointee of a Pointer or concrete value of an Interface. Invalid if nil or of another kind.
  [[nodiscard]] ValueRef elem() const noexcept;

  // Unchecked access, T must be the exact type described by type().
  template <class T>
  [[nodiscard]] const T &as() const noexcept {
    return *static_cast<const T *>(_ptr);
  }

 private:
  const TypeInfo *_type{nullptr};
  const void *_ptr{nullptr};
  bool _addressable{false};
};

}  // namespace vencode

#include "vencode/type-info.hpp"

#include <cstddef>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vencode/kind.hpp"
#include "vencode/struct-builder.hpp"
#include "vencode/value-ref.hpp"
#include "vencode/vector.hpp"

namespace vencode {

Kind ValueRef::kind() const noexcept { return _type == nullptr || _ptr == nullptr ? Kind::Invalid : _type->kind; }

ValueRef ValueRef::elem() const noexcept {
  switch (kind()) {
    case Kind::Pointer: {
      const void *pointee = _type->ops.deref(_ptr);
      if (pointee == nullptr) {
        return {};
      }
      // an optional holds its value: it is mutable if the optional itself is
      const bool addressable = _type->inlinePointee ? _addressable : !_type->constPointee;
      return {*_type->elem(), pointee, addressable};
    }
    case Kind::Interface:
      return _type->ops.unwrap(_ptr);
    default:
      return {};
  }
}

ValueRef FieldInfo::field(ValueRef parent) const {
  const void *ptr = parent.ptr();
  bool addressable = parent.addressable();
  for (const FieldStep &step : path) {
    ptr = step.access(ptr);
    if (ptr == nullptr) {
      return {};
    }
    if (step.throughPointer) {
      addressable = !step.constPointee;
    }
  }
  return {type(), ptr, addressable};
}

bool IsAsciiAlphaNum(std::string_view name) noexcept {
  for (char ch : name) {
    const bool alphaNum = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_';
    if (!alphaNum) {
      return false;
    }
  }
  return true;
}

namespace internal {

void ResolveFieldNames(vector<FieldInfo> &fields) {
  std::unordered_map<std::string_view, std::size_t> bestPos;
  for (std::size_t pos = 0; pos < fields.size(); ++pos) {
    auto [it, inserted] = bestPos.try_emplace(fields[pos].encName, pos);
    if (!inserted && fields[pos].depth < fields[it->second].depth) {
      it->second = pos;
    }
  }
  if (bestPos.size() == fields.size()) {
    return;
  }

  std::vector<bool> keep(fields.size(), false);
  for (const auto &[name, pos] : bestPos) {
    keep[pos] = true;
  }
  vector<FieldInfo> kept;
  kept.reserve(bestPos.size());
  for (std::size_t pos = 0; pos < fields.size(); ++pos) {
    if (keep[pos]) {
      kept.push_back(std::move(fields[pos]));
    }
  }
  fields.swap(kept);
}

}  // namespace internal

}  // namespace vencode

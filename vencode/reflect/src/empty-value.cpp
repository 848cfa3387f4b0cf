#include "vencode/empty-value.hpp"

#include <cstddef>

#include "vencode/kind.hpp"
#include "vencode/timedef.hpp"
#include "vencode/type-info.hpp"
#include "vencode/value-ref.hpp"

namespace vencode {

namespace {

bool AllFieldsEmpty(ValueRef value, bool recursive) {
  for (const FieldInfo &fieldInfo : value.type()->fieldsSrc) {
    if (!IsEmptyValue(fieldInfo.field(value), recursive)) {
      return false;
    }
  }
  return true;
}

bool AllElementsEmpty(ValueRef value, bool recursive) {
  const TypeInfo &type = *value.type();
  const TypeInfo &elemType = *type.elem();
  const std::size_t len = type.ops.len(value.ptr());
  for (std::size_t pos = 0; pos < len; ++pos) {
    if (!IsEmptyValue(ValueRef(elemType, type.ops.index(value.ptr(), pos), value.addressable()), recursive)) {
      return false;
    }
  }
  return true;
}

}  // namespace

bool IsEmptyValue(ValueRef value, bool recursive) {
  if (!value.valid()) {
    return true;
  }
  const TypeInfo &type = *value.type();
  const TypeOps &ops = type.ops;
  if (type.caps.codecEmpty) {
    return ops.isCodecEmpty(value.ptr());
  }
  switch (type.kind) {
    case Kind::Invalid:
      return true;
    case Kind::Bool:
      return !ops.getBool(value.ptr());
    case Kind::Int:
      return ops.getInt(value.ptr()) == 0;
    case Kind::Uint:
      return ops.getUint(value.ptr()) == 0;
    case Kind::Float32:
      [[fallthrough]];
    case Kind::Float64:
      return ops.getFloat(value.ptr()) == 0;
    case Kind::Time:
      return ops.getTime(value.ptr()) == SysTimePoint{};
    case Kind::String:
      [[fallthrough]];
    case Kind::Slice:
      [[fallthrough]];
    case Kind::Map:
      return ops.len(value.ptr()) == 0;
    case Kind::Array:
      if (type.arrayLen == 0) {
        return true;
      }
      return recursive || ops.isZero == nullptr ? AllElementsEmpty(value, recursive) : ops.isZero(value.ptr());
    case Kind::Pointer:
      [[fallthrough]];
    case Kind::Interface: {
      if (ops.isNil(value.ptr())) {
        return true;
      }
      return recursive && IsEmptyValue(value.elem(), recursive);
    }
    case Kind::Chan:
      return ops.isNil(value.ptr()) || ops.len(value.ptr()) == 0;
    case Kind::Func:
      return ops.isNil(value.ptr());
    case Kind::Struct:
      if (!recursive && ops.isZero != nullptr) {
        return ops.isZero(value.ptr());
      }
      return AllFieldsEmpty(value, recursive);
    case Kind::Unsupported:
      return ops.isZero != nullptr && ops.isZero(value.ptr());
  }
  return false;
}

}  // namespace vencode

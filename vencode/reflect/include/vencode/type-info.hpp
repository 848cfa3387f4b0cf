#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <typeindex>

#include "vencode/any.hpp"
#include "vencode/kind.hpp"
#include "vencode/raw-bytes.hpp"
#include "vencode/timedef.hpp"
#include "vencode/value-ref.hpp"
#include "vencode/vector.hpp"

namespace vencode {

class Encoder;
struct TypeInfo;

using TypeInfoGetter = const TypeInfo &(*)();

// Extra dynamic fields of a struct, merged after its static fields.
using MissingFields = std::map<std::string, Any>;

// A value owned by its holder, for instance the elements drained out of a channel.
struct OwnedValue {
  std::shared_ptr<void> holder;
  ValueRef ref;
};

// Type-erased accessors of a type. Only the entries relevant to the kind and capabilities of the type are set.
struct TypeOps {
  using MapVisitor = void (*)(void *ctx, const void *key, const void *value);

  bool (*getBool)(const void *){};
  std::int64_t (*getInt)(const void *){};
  std::uint64_t (*getUint)(const void *){};
  double (*getFloat)(const void *){};
  std::string_view (*getString)(const void *){};
  SysTimePoint (*getTime)(const void *){};

  // Slice, Array, Map, String and Chan
  std::size_t (*len)(const void *){};
  // Slice and Array
  const void *(*index)(const void *, std::size_t){};
  // Contiguous sequences of single byte unsigned elements only
  std::span<const std::byte> (*bytes)(const void *){};
  // Map, in the container iteration order
  void (*forEachEntry)(const void *, void *ctx, MapVisitor){};

  // Pointer, Interface, Chan and Func
  bool (*isNil)(const void *){};
  // Pointer: address of the pointee, nullptr if nil
  const void *(*deref)(const void *){};
  // Interface
  ValueRef (*unwrap)(const void *){};
  // Chan: receives the available values into a vector of the element type
  OwnedValue (*drain)(const void *, std::chrono::milliseconds){};
  // Chan of bytes: appends the available bytes to the buffer
  void (*drainBytes)(const void *, std::chrono::milliseconds, RawBytes &){};

  // New heap allocated, mutable copy of the value. Not set for non copyable types.
  std::shared_ptr<void> (*copy)(const void *){};
  // Comparison with a value initialized object, for equality comparable structs.
  bool (*isZero)(const void *){};

  void (*encodeSelf)(const void *, Encoder &){};
  RawBytes (*marshalBinary)(const void *){};
  std::string (*marshalText)(const void *){};
  std::string (*marshalJson)(const void *){};
  MissingFields (*missingFields)(const void *){};
  bool (*isCodecEmpty)(const void *){};
};

// Capabilities detected on a type. 'xxxNeedsAddr' is set when the method is only available on a mutable object.
struct TypeCapabilities {
  bool selfer{false};
  bool selferNeedsAddr{false};
  bool binaryMarshaler{false};
  bool binaryMarshalerNeedsAddr{false};
  bool textMarshaler{false};
  bool textMarshalerNeedsAddr{false};
  bool jsonMarshaler{false};
  bool jsonMarshalerNeedsAddr{false};
  bool missingFielder{false};
  bool missingFielderNeedsAddr{false};
  bool codecEmpty{false};
  bool raw{false};
  bool rawExt{false};
  bool copyable{false};
};

// One step of a field access path.
struct FieldStep {
  // Address of the member in 'parent', nullptr if the step goes through a nil pointer.
  const void *(*access)(const void *parent){};
  // The step dereferences an embedded pointer.
  bool throughPointer{false};
  // The dereferenced embedded pointer points to a const object.
  bool constPointee{false};
};

struct FieldInfo {
  [[nodiscard]] const TypeInfo &type() const { return typeGetter(); }

  // Value of this field in 'parent', invalid if the path crosses a nil embedded pointer.
  [[nodiscard]] ValueRef field(ValueRef parent) const;

  std::string encName;
  TypeInfoGetter typeGetter{};
  SmallVector<FieldStep, 2> path;
  std::uint32_t depth{0};
  bool omitEmpty{false};
  bool encNameAsciiAlphaNum{false};
};

// Immutable descriptor of a C++ type, built once and shared for the process lifetime.
struct TypeInfo {
  explicit TypeInfo(std::type_index typeId) noexcept : id(typeId) {}

  TypeInfo(const TypeInfo &) = delete;
  TypeInfo &operator=(const TypeInfo &) = delete;

  [[nodiscard]] const TypeInfo *elem() const { return elemGetter == nullptr ? nullptr : &elemGetter(); }

  [[nodiscard]] const TypeInfo *key() const { return keyGetter == nullptr ? nullptr : &keyGetter(); }

  [[nodiscard]] bool isByteSequence() const noexcept { return ops.bytes != nullptr; }

  std::type_index id;
  std::string name;
  Kind kind{Kind::Unsupported};
  std::size_t size{0};
  TypeInfoGetter elemGetter{};
  TypeInfoGetter keyGetter{};
  std::size_t arrayLen{0};
  ChanDir chanDir{ChanDir::None};
  // Pointer: the pointee is stored inside the value (optional). Its mutability follows the one of the holder.
  bool inlinePointee{false};
  // Pointer: the pointee is const.
  bool constPointee{false};
  bool mapBySlice{false};
  bool toArray{false};
  bool omitEmptyAll{false};
  KeyType keyType{KeyType::String};
  vector<FieldInfo> fieldsSrc;
  vector<const FieldInfo *> fieldsSorted;
  TypeCapabilities caps;
  TypeOps ops;
};

}  // namespace vencode

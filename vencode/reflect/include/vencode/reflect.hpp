#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "vencode/any.hpp"
#include "vencode/chan.hpp"
#include "vencode/internal/type-traits.hpp"
#include "vencode/kind.hpp"
#include "vencode/raw-bytes.hpp"
#include "vencode/raw.hpp"
#include "vencode/struct-builder.hpp"
#include "vencode/timedef.hpp"
#include "vencode/type-info.hpp"
#include "vencode/type-registry.hpp"
#include "vencode/value-ref.hpp"

namespace vencode {

namespace internal {

// Receives from 'chan' according to 'timeout':
//  - 0 : only the values immediately available,
//  - <0: every value until the channel is closed,
//  - >0: values until the channel is closed or the timeout expires.
template <class C, class Fn>
void DrainChan(const C &chan, std::chrono::milliseconds timeout, Fn &&fn) {
  if (timeout == std::chrono::milliseconds::zero()) {
    while (auto value = chan.tryRecv()) {
      fn(std::move(*value));
    }
  } else if (timeout < std::chrono::milliseconds::zero()) {
    while (auto value = chan.recv()) {
      fn(std::move(*value));
    }
  } else {
    const SteadyTimePoint deadline = SteadyClock::now() + timeout;
    while (auto value = chan.recvUntil(deadline)) {
      fn(std::move(*value));
    }
  }
}

template <class T, class E>
void FillSequence(TypeInfo &typeInfo, Kind kind) {
  typeInfo.kind = kind;
  typeInfo.elemGetter = &TypeInfoFor<std::remove_cv_t<E>>;
  typeInfo.ops.len = [](const void *ptr) -> std::size_t { return std::size(*static_cast<const T *>(ptr)); };
  if constexpr (IsStdDeque<T>::value) {
    typeInfo.ops.index = [](const void *ptr, std::size_t pos) -> const void * {
      return &(*static_cast<const T *>(ptr))[pos];
    };
  } else {
    typeInfo.ops.index = [](const void *ptr, std::size_t pos) -> const void * {
      return std::data(*static_cast<const T *>(ptr)) + pos;
    };
    if constexpr (ByteElement<std::remove_cv_t<E>>) {
      typeInfo.ops.bytes = [](const void *ptr) -> std::span<const std::byte> {
        const T &seq = *static_cast<const T *>(ptr);
        return {reinterpret_cast<const std::byte *>(std::data(seq)), std::size(seq)};
      };
    }
  }
}

template <class T>
void FillMap(TypeInfo &typeInfo) {
  typeInfo.kind = Kind::Map;
  typeInfo.keyGetter = &TypeInfoFor<std::remove_cv_t<typename T::key_type>>;
  typeInfo.elemGetter = &TypeInfoFor<std::remove_cv_t<typename T::mapped_type>>;
  typeInfo.ops.len = [](const void *ptr) -> std::size_t { return static_cast<const T *>(ptr)->size(); };
  typeInfo.ops.forEachEntry = [](const void *ptr, void *ctx, TypeOps::MapVisitor visit) {
    for (const auto &[key, value] : *static_cast<const T *>(ptr)) {
      visit(ctx, &key, &value);
    }
  };
}

template <class T, class E>
void FillPointer(TypeInfo &typeInfo) {
  typeInfo.kind = Kind::Pointer;
  typeInfo.elemGetter = &TypeInfoFor<std::remove_cv_t<E>>;
  typeInfo.constPointee = std::is_const_v<E>;
  if constexpr (IsOptional<T>::value) {
    typeInfo.inlinePointee = true;
    typeInfo.ops.isNil = [](const void *ptr) { return !static_cast<const T *>(ptr)->has_value(); };
    typeInfo.ops.deref = [](const void *ptr) -> const void * {
      const T &opt = *static_cast<const T *>(ptr);
      return opt.has_value() ? &*opt : nullptr;
    };
  } else if constexpr (std::is_pointer_v<T>) {
    typeInfo.ops.isNil = [](const void *ptr) { return *static_cast<const T *>(ptr) == nullptr; };
    typeInfo.ops.deref = [](const void *ptr) -> const void * { return *static_cast<const T *>(ptr); };
  } else {
    typeInfo.ops.isNil = [](const void *ptr) { return static_cast<const T *>(ptr)->get() == nullptr; };
    typeInfo.ops.deref = [](const void *ptr) -> const void * { return static_cast<const T *>(ptr)->get(); };
  }
}

template <class T>
void FillChan(TypeInfo &typeInfo) {
  using E = typename T::value_type;

  typeInfo.kind = Kind::Chan;
  typeInfo.chanDir = ChanTraits<T>::kDir;
  typeInfo.elemGetter = &TypeInfoFor<E>;
  typeInfo.ops.isNil = [](const void *ptr) { return static_cast<const T *>(ptr)->isNil(); };
  typeInfo.ops.len = [](const void *ptr) -> std::size_t {
    const T &chan = *static_cast<const T *>(ptr);
    return chan.isNil() ? 0 : chan.size();
  };
  if constexpr (CanRecv(ChanTraits<T>::kDir)) {
    // Drained elements are held in a deque, which unlike vector also stores bools as real objects.
    typeInfo.ops.drain = [](const void *ptr, std::chrono::milliseconds timeout) -> OwnedValue {
      auto values = std::make_shared<std::deque<E>>();
      DrainChan(*static_cast<const T *>(ptr), timeout, [&values](E &&value) { values->push_back(std::move(value)); });
      ValueRef ref(TypeInfoFor<std::deque<E>>(), values.get(), true);
      return OwnedValue{std::move(values), ref};
    };
    if constexpr (ByteElement<E>) {
      typeInfo.ops.drainBytes = [](const void *ptr, std::chrono::milliseconds timeout, RawBytes &out) {
        DrainChan(*static_cast<const T *>(ptr), timeout,
                  [&out](E &&value) { out.push_back(static_cast<std::byte>(value)); });
      };
    }
  }
}

template <class T>
void FillKind(TypeInfo &typeInfo) {
  TypeOps &ops = typeInfo.ops;
  if constexpr (std::same_as<T, bool>) {
    typeInfo.kind = Kind::Bool;
    ops.getBool = [](const void *ptr) { return *static_cast<const bool *>(ptr); };
  } else if constexpr (std::same_as<T, std::byte>) {
    typeInfo.kind = Kind::Uint;
    ops.getUint = [](const void *ptr) { return std::to_integer<std::uint64_t>(*static_cast<const std::byte *>(ptr)); };
  } else if constexpr (std::integral<T> && (std::is_signed_v<T> || std::same_as<T, char>)) {
    typeInfo.kind = Kind::Int;
    ops.getInt = [](const void *ptr) { return static_cast<std::int64_t>(*static_cast<const T *>(ptr)); };
  } else if constexpr (std::integral<T>) {
    typeInfo.kind = Kind::Uint;
    ops.getUint = [](const void *ptr) { return static_cast<std::uint64_t>(*static_cast<const T *>(ptr)); };
  } else if constexpr (std::is_enum_v<T>) {
    // described by their underlying integer
    using U = std::underlying_type_t<T>;
    if constexpr (std::is_signed_v<U> || std::same_as<U, char>) {
      typeInfo.kind = Kind::Int;
      ops.getInt = [](const void *ptr) {
        return static_cast<std::int64_t>(static_cast<U>(*static_cast<const T *>(ptr)));
      };
    } else {
      typeInfo.kind = Kind::Uint;
      ops.getUint = [](const void *ptr) {
        return static_cast<std::uint64_t>(static_cast<U>(*static_cast<const T *>(ptr)));
      };
    }
  } else if constexpr (std::floating_point<T>) {
    typeInfo.kind = std::same_as<T, float> ? Kind::Float32 : Kind::Float64;
    ops.getFloat = [](const void *ptr) { return static_cast<double>(*static_cast<const T *>(ptr)); };
  } else if constexpr (std::same_as<T, std::string> || std::same_as<T, std::string_view>) {
    typeInfo.kind = Kind::String;
    ops.getString = [](const void *ptr) { return std::string_view(*static_cast<const T *>(ptr)); };
    ops.len = [](const void *ptr) -> std::size_t { return static_cast<const T *>(ptr)->size(); };
  } else if constexpr (CString<T>) {
    typeInfo.kind = Kind::String;
    ops.getString = [](const void *ptr) {
      const char *str = *static_cast<const T *>(ptr);
      return str == nullptr ? std::string_view() : std::string_view(str);
    };
    ops.len = [](const void *ptr) -> std::size_t {
      const char *str = *static_cast<const T *>(ptr);
      return str == nullptr ? 0 : std::char_traits<char>::length(str);
    };
    ops.isNil = [](const void *ptr) { return *static_cast<const T *>(ptr) == nullptr; };
  } else if constexpr (IsSysTimePoint<T>::value) {
    typeInfo.kind = Kind::Time;
    ops.getTime = [](const void *ptr) {
      return std::chrono::time_point_cast<SysDuration>(*static_cast<const T *>(ptr));
    };
  } else if constexpr (std::same_as<T, Any>) {
    typeInfo.kind = Kind::Interface;
    ops.isNil = [](const void *ptr) { return static_cast<const Any *>(ptr)->isNil(); };
    ops.unwrap = [](const void *ptr) { return static_cast<const Any *>(ptr)->ref(); };
  } else if constexpr (FunctionLike<T>) {
    typeInfo.kind = Kind::Func;
    ops.isNil = [](const void *ptr) { return !static_cast<bool>(*static_cast<const T *>(ptr)); };
  } else if constexpr (ObjectPointer<T>) {
    FillPointer<T, std::remove_pointer_t<T>>(typeInfo);
  } else if constexpr (IsSmartPointer<T>::value) {
    FillPointer<T, typename T::element_type>(typeInfo);
  } else if constexpr (IsOptional<T>::value) {
    FillPointer<T, typename T::value_type>(typeInfo);
  } else if constexpr (ChanTraits<T>::kDir != ChanDir::None) {
    FillChan<T>(typeInfo);
  } else if constexpr (std::same_as<T, RawBytes>) {
    FillSequence<T, std::byte>(typeInfo, Kind::Slice);
  } else if constexpr (MapBySliceSequence<T>) {
    FillSequence<T, typename T::value_type>(typeInfo, Kind::Slice);
    typeInfo.mapBySlice = true;
  } else if constexpr ((IsStdVector<T>::value || IsStdDeque<T>::value) &&
                       !(IsStdVector<T>::value && std::same_as<typename T::value_type, bool>)) {
    FillSequence<T, typename T::value_type>(typeInfo, Kind::Slice);
  } else if constexpr (IsStdArray<T>::value) {
    FillSequence<T, typename T::value_type>(typeInfo, Kind::Array);
    typeInfo.arrayLen = std::tuple_size_v<T>;
  } else if constexpr (std::is_bounded_array_v<T>) {
    FillSequence<T, std::remove_extent_t<T>>(typeInfo, Kind::Array);
    typeInfo.arrayLen = std::extent_v<T>;
  } else if constexpr (IsAssociative<T>::value) {
    FillMap<T>(typeInfo);
  } else if constexpr (DescribedStruct<T>) {
    StructBuilder<T> builder;
    StructMeta<T>::describe(builder);
    builder.buildInto(typeInfo);
  } else {
    typeInfo.kind = Kind::Unsupported;
  }
}

template <class T>
void FillCapabilities(TypeInfo &typeInfo) {
  TypeCapabilities &caps = typeInfo.caps;
  TypeOps &ops = typeInfo.ops;

  if constexpr (IsCopyable<T>::value) {
    caps.copyable = true;
    ops.copy = [](const void *ptr) -> std::shared_ptr<void> {
      return std::make_shared<T>(*static_cast<const T *>(ptr));
    };
  }

  if constexpr (std::is_class_v<T>) {
    // Methods only available on mutable objects are reached through a const_cast. The encoder guarantees that
    // the object is addressable (mutable) before calling them.
    if constexpr (ConstSelfer<T>) {
      caps.selfer = true;
      ops.encodeSelf = [](const void *ptr, Encoder &enc) { static_cast<const T *>(ptr)->encodeSelf(enc); };
    } else if constexpr (Selfer<T>) {
      caps.selfer = caps.selferNeedsAddr = true;
      ops.encodeSelf = [](const void *ptr, Encoder &enc) {
        const_cast<T *>(static_cast<const T *>(ptr))->encodeSelf(enc);
      };
    }
    if constexpr (ConstBinaryMarshaler<T>) {
      caps.binaryMarshaler = true;
      ops.marshalBinary = [](const void *ptr) -> RawBytes { return static_cast<const T *>(ptr)->marshalBinary(); };
    } else if constexpr (BinaryMarshaler<T>) {
      caps.binaryMarshaler = caps.binaryMarshalerNeedsAddr = true;
      ops.marshalBinary = [](const void *ptr) -> RawBytes {
        return const_cast<T *>(static_cast<const T *>(ptr))->marshalBinary();
      };
    }
    if constexpr (ConstTextMarshaler<T>) {
      caps.textMarshaler = true;
      ops.marshalText = [](const void *ptr) -> std::string { return static_cast<const T *>(ptr)->marshalText(); };
    } else if constexpr (TextMarshaler<T>) {
      caps.textMarshaler = caps.textMarshalerNeedsAddr = true;
      ops.marshalText = [](const void *ptr) -> std::string {
        return const_cast<T *>(static_cast<const T *>(ptr))->marshalText();
      };
    }
    if constexpr (ConstJsonMarshaler<T>) {
      caps.jsonMarshaler = true;
      ops.marshalJson = [](const void *ptr) -> std::string { return static_cast<const T *>(ptr)->marshalJson(); };
    } else if constexpr (JsonMarshaler<T>) {
      caps.jsonMarshaler = caps.jsonMarshalerNeedsAddr = true;
      ops.marshalJson = [](const void *ptr) -> std::string {
        return const_cast<T *>(static_cast<const T *>(ptr))->marshalJson();
      };
    }
    if constexpr (ConstMissingFielder<T>) {
      caps.missingFielder = true;
      ops.missingFields = [](const void *ptr) -> MissingFields { return static_cast<const T *>(ptr)->missingFields(); };
    } else if constexpr (MissingFielder<T>) {
      caps.missingFielder = caps.missingFielderNeedsAddr = true;
      ops.missingFields = [](const void *ptr) -> MissingFields {
        return const_cast<T *>(static_cast<const T *>(ptr))->missingFields();
      };
    }
    if constexpr (CodecEmptyer<T>) {
      caps.codecEmpty = true;
      ops.isCodecEmpty = [](const void *ptr) -> bool { return static_cast<const T *>(ptr)->isCodecEmpty(); };
    }
    if constexpr (DescribedStruct<T> && std::equality_comparable<T> && std::default_initializable<T>) {
      ops.isZero = [](const void *ptr) -> bool { return *static_cast<const T *>(ptr) == T{}; };
    }
    caps.raw = std::same_as<T, Raw>;
    caps.rawExt = std::same_as<T, RawExt>;
  }
}

template <class T>
std::unique_ptr<TypeInfo> BuildTypeInfo() {
  auto typeInfo = std::make_unique<TypeInfo>(std::type_index(typeid(T)));
  typeInfo->name = DemangledTypeName(typeid(T));
  typeInfo->size = sizeof(T);
  FillKind<T>(*typeInfo);
  FillCapabilities<T>(*typeInfo);
  return typeInfo;
}

}  // namespace internal

// Descriptor of type T, built on first use and shared for the process lifetime.
template <class T>
const TypeInfo &TypeInfoFor() {
  static const TypeInfo &gTypeInfo =
      TypeRegistry::instance().publish(std::type_index(typeid(T)), &internal::BuildTypeInfo<T>);
  return gTypeInfo;
}

// Read-only view of 'value'.
template <class T>
ValueRef ValueOf(const T &value) {
  return ValueRef(TypeInfoFor<std::remove_cv_t<T>>(), std::addressof(value), false);
}

// Addressable view of 'value': capabilities requiring a mutable object are called on it directly.
template <class T>
ValueRef MutableValueOf(T &value) {
  return ValueRef(TypeInfoFor<std::remove_cv_t<T>>(), std::addressof(value), true);
}

}  // namespace vencode

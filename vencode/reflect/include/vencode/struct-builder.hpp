#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "vencode/internal/type-traits.hpp"
#include "vencode/kind.hpp"
#include "vencode/type-info.hpp"
#include "vencode/vector.hpp"

namespace vencode {

// Specialize this template for a class type to make it a Struct for the encoder:
//
//   template <>
//   struct vencode::StructMeta<Point> {
//     static void describe(StructBuilder<Point> &builder) {
//       builder.field<&Point::x>("x").field<&Point::y>("y", FieldFlag::OmitEmpty);
//     }
//   };
template <class T>
struct StructMeta;

enum class FieldFlag : std::uint8_t { None = 0, OmitEmpty = 1U << 0 };

[[nodiscard]] bool IsAsciiAlphaNum(std::string_view name) noexcept;

namespace internal {

template <class T, auto Member>
const void *AccessMember(const void *parent) {
  return &(static_cast<const T *>(parent)->*Member);
}

template <class T, auto Member>
const void *AccessEmbeddedPointee(const void *parent) {
  const auto &ptr = static_cast<const T *>(parent)->*Member;
  if constexpr (std::is_pointer_v<std::remove_cvref_t<decltype(ptr)>>) {
    return ptr;
  } else {
    return ptr.get();
  }
}

// Keeps, for each key name, the shallowest field. Equal depths keep the first declared one.
void ResolveFieldNames(vector<FieldInfo> &fields);

}  // namespace internal

template <class T>
class StructBuilder;

template <class T>
concept DescribedStruct = std::is_class_v<T> && requires(StructBuilder<T> &builder) {
  StructMeta<T>::describe(builder);
};

template <class T>
class StructBuilder {
 public:
  // Declares member 'Member' encoded under key 'encName'.
  template <auto Member>
  StructBuilder &field(std::string_view encName, FieldFlag flags = FieldFlag::None) {
    using M = std::remove_cv_t<typename internal::MemberPointerTraits<decltype(Member)>::member_type>;

    FieldInfo &fieldInfo = _fields.emplace_back();
    fieldInfo.encName = encName;
    fieldInfo.typeGetter = &TypeInfoFor<M>;
    fieldInfo.path.push_back(FieldStep{&internal::AccessMember<T, Member>, false, false});
    fieldInfo.omitEmpty = (static_cast<std::uint8_t>(flags) & static_cast<std::uint8_t>(FieldFlag::OmitEmpty)) != 0;
    fieldInfo.encNameAsciiAlphaNum = IsAsciiAlphaNum(encName);
    return *this;
  }

  // Flattens the fields of the described struct 'Member' (held by value or by pointer) into this struct.
  template <auto Member>
  StructBuilder &embed() {
    using M = std::remove_cv_t<typename internal::MemberPointerTraits<decltype(Member)>::member_type>;

    FieldStep step;
    const TypeInfo *embedded;
    if constexpr (internal::ObjectPointer<M>) {
      using B = std::remove_pointer_t<M>;
      static_assert(DescribedStruct<std::remove_cv_t<B>>, "embedded member must point to a described struct");
      step = FieldStep{&internal::AccessEmbeddedPointee<T, Member>, true, std::is_const_v<B>};
      embedded = &TypeInfoFor<std::remove_cv_t<B>>();
    } else if constexpr (internal::IsSmartPointer<M>::value) {
      using B = typename M::element_type;
      static_assert(DescribedStruct<std::remove_cv_t<B>>, "embedded member must point to a described struct");
      step = FieldStep{&internal::AccessEmbeddedPointee<T, Member>, true, std::is_const_v<B>};
      embedded = &TypeInfoFor<std::remove_cv_t<B>>();
    } else {
      static_assert(DescribedStruct<M>, "embedded member must be a described struct");
      step = FieldStep{&internal::AccessMember<T, Member>, false, false};
      embedded = &TypeInfoFor<M>();
    }

    for (const FieldInfo &embeddedField : embedded->fieldsSrc) {
      FieldInfo &fieldInfo = _fields.emplace_back(embeddedField);
      fieldInfo.path.clear();
      fieldInfo.path.push_back(step);
      fieldInfo.path.insert(fieldInfo.path.end(), embeddedField.path.begin(), embeddedField.path.end());
      ++fieldInfo.depth;
    }
    return *this;
  }

  // Encodes the struct as an array of its field values in declaration order.
  StructBuilder &toArray(bool enable = true) {
    _toArray = enable;
    return *this;
  }

  // Applies omit-if-empty to every field, and to extra dynamic fields.
  StructBuilder &omitEmpty(bool enable = true) {
    _omitEmpty = enable;
    return *this;
  }

  StructBuilder &keyType(KeyType keyType) {
    _keyType = keyType;
    return *this;
  }

  // Moves the description into 'typeInfo'. The builder should not be used afterwards.
  void buildInto(TypeInfo &typeInfo) {
    internal::ResolveFieldNames(_fields);
    typeInfo.kind = Kind::Struct;
    typeInfo.toArray = _toArray;
    typeInfo.omitEmptyAll = _omitEmpty;
    typeInfo.keyType = _keyType;
    if (_omitEmpty) {
      for (FieldInfo &fieldInfo : _fields) {
        fieldInfo.omitEmpty = true;
      }
    }
    typeInfo.fieldsSrc = std::move(_fields);
    typeInfo.fieldsSorted.reserve(typeInfo.fieldsSrc.size());
    for (const FieldInfo &fieldInfo : typeInfo.fieldsSrc) {
      typeInfo.fieldsSorted.push_back(&fieldInfo);
    }
    std::ranges::stable_sort(typeInfo.fieldsSorted,
                             [](const FieldInfo *lhs, const FieldInfo *rhs) { return lhs->encName < rhs->encName; });
  }

 private:
  vector<FieldInfo> _fields;
  KeyType _keyType{KeyType::String};
  bool _toArray{false};
  bool _omitEmpty{false};
};

}  // namespace vencode

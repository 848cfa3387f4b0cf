#pragma once

#include <array>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "vencode/chan.hpp"
#include "vencode/raw-bytes.hpp"
#include "vencode/raw.hpp"
#include "vencode/type-info.hpp"

namespace vencode::internal {

template <class T>
struct IsStdVector : std::false_type {};

template <class E, class A>
struct IsStdVector<std::vector<E, A>> : std::true_type {};

template <class T>
struct IsStdDeque : std::false_type {};

template <class E, class A>
struct IsStdDeque<std::deque<E, A>> : std::true_type {};

template <class T>
struct IsStdArray : std::false_type {};

template <class E, std::size_t N>
struct IsStdArray<std::array<E, N>> : std::true_type {};

template <class T>
struct IsAssociative : std::false_type {};

template <class K, class V, class C, class A>
struct IsAssociative<std::map<K, V, C, A>> : std::true_type {};

template <class K, class V, class H, class E, class A>
struct IsAssociative<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <class T>
struct IsSmartPointer : std::false_type {};

template <class E>
struct IsSmartPointer<std::shared_ptr<E>> : std::true_type {};

template <class E, class D>
struct IsSmartPointer<std::unique_ptr<E, D>> : std::true_type {};

template <class T>
struct IsOptional : std::false_type {};

template <class E>
struct IsOptional<std::optional<E>> : std::true_type {};

template <class T>
struct IsSysTimePoint : std::false_type {};

template <class D>
struct IsSysTimePoint<std::chrono::time_point<std::chrono::system_clock, D>> : std::true_type {};

template <class T>
struct ChanTraits {
  static constexpr ChanDir kDir = ChanDir::None;
};

template <class E>
struct ChanTraits<Chan<E>> {
  static constexpr ChanDir kDir = ChanDir::Both;
};

template <class E>
struct ChanTraits<RecvChan<E>> {
  static constexpr ChanDir kDir = ChanDir::Recv;
};

template <class E>
struct ChanTraits<SendChan<E>> {
  static constexpr ChanDir kDir = ChanDir::Send;
};

template <class T>
struct IsStdFunction : std::false_type {};

template <class Sig>
struct IsStdFunction<std::function<Sig>> : std::true_type {};

// Copy constructibility, looking into the element types of standard containers whose copy constructor is not
// constrained.
template <class T>
struct IsCopyable : std::bool_constant<std::is_copy_constructible_v<T>> {};

template <class E, class A>
struct IsCopyable<std::vector<E, A>> : IsCopyable<E> {};

template <class E>
struct IsCopyable<MapBySlice<E>> : IsCopyable<E> {};

template <class E, class A>
struct IsCopyable<std::deque<E, A>> : IsCopyable<E> {};

template <class E, std::size_t N>
struct IsCopyable<std::array<E, N>> : IsCopyable<E> {};

template <class K, class V, class C, class A>
struct IsCopyable<std::map<K, V, C, A>> : std::conjunction<IsCopyable<K>, IsCopyable<V>> {};

template <class K, class V, class H, class E, class A>
struct IsCopyable<std::unordered_map<K, V, H, E, A>> : std::conjunction<IsCopyable<K>, IsCopyable<V>> {};

template <class T>
struct MemberPointerTraits;

template <class C, class M>
struct MemberPointerTraits<M C::*> {
  using class_type = C;
  using member_type = M;
};

template <class T>
concept ByteElement = std::same_as<T, std::byte> || std::same_as<T, unsigned char>;

template <class T>
concept MapBySliceSequence = requires(const T &seq) {
  requires T::kMapBySlice;
  typename T::value_type;
  { seq.size() } -> std::convertible_to<std::size_t>;
  { seq.data() };
};

// Null terminated character strings are strings, not pointers to a single char.
template <class T>
concept CString = std::same_as<T, const char *> || std::same_as<T, char *>;

template <class T>
concept ObjectPointer =
    std::is_pointer_v<T> && std::is_object_v<std::remove_pointer_t<T>> && !std::is_void_v<std::remove_pointer_t<T>>;

template <class T>
concept FunctionLike = IsStdFunction<T>::value || (std::is_pointer_v<T> && std::is_function_v<std::remove_pointer_t<T>>);

// Capabilities. Non-const variants are only detected when the const one is absent.
template <class T>
concept ConstSelfer = requires(const T &obj, Encoder &enc) { obj.encodeSelf(enc); };

template <class T>
concept Selfer = requires(T &obj, Encoder &enc) { obj.encodeSelf(enc); };

template <class T>
concept ConstBinaryMarshaler = requires(const T &obj) {
  { obj.marshalBinary() } -> std::convertible_to<RawBytes>;
};

template <class T>
concept BinaryMarshaler = requires(T &obj) {
  { obj.marshalBinary() } -> std::convertible_to<RawBytes>;
};

template <class T>
concept ConstTextMarshaler = requires(const T &obj) {
  { obj.marshalText() } -> std::convertible_to<std::string>;
};

template <class T>
concept TextMarshaler = requires(T &obj) {
  { obj.marshalText() } -> std::convertible_to<std::string>;
};

template <class T>
concept ConstJsonMarshaler = requires(const T &obj) {
  { obj.marshalJson() } -> std::convertible_to<std::string>;
};

template <class T>
concept JsonMarshaler = requires(T &obj) {
  { obj.marshalJson() } -> std::convertible_to<std::string>;
};

template <class T>
concept ConstMissingFielder = requires(const T &obj) {
  { obj.missingFields() } -> std::convertible_to<MissingFields>;
};

template <class T>
concept MissingFielder = requires(T &obj) {
  { obj.missingFields() } -> std::convertible_to<MissingFields>;
};

template <class T>
concept CodecEmptyer = requires(const T &obj) {
  { obj.isCodecEmpty() } -> std::convertible_to<bool>;
};

}  // namespace vencode::internal

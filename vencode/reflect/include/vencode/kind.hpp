#pragma once

#include <cstdint>
#include <string_view>

namespace vencode {

// Runtime shape of a value, as seen by the encoder.
enum class Kind : std::uint8_t {
  Invalid,
  Bool,
  Int,
  Uint,
  Float32,
  Float64,
  String,
  Time,
  Slice,
  Array,
  Map,
  Struct,
  Pointer,
  Interface,
  Chan,
  Func,
  Unsupported
};

[[nodiscard]] std::string_view KindName(Kind kind) noexcept;

enum class ChanDir : std::uint8_t { None = 0, Recv = 1U << 0, Send = 1U << 1, Both = Recv | Send };

[[nodiscard]] constexpr bool CanRecv(ChanDir dir) noexcept {
  return (static_cast<std::uint8_t>(dir) & static_cast<std::uint8_t>(ChanDir::Recv)) != 0;
}

// How the keys of a struct encoded as a map are written.
// Non string modes parse the declared key names, which allows formats keyed by numeric codes.
enum class KeyType : std::uint8_t { String, Int, Uint, Float };

[[nodiscard]] std::string_view KeyTypeName(KeyType keyType) noexcept;

}  // namespace vencode

#include "vencode/kind.hpp"

#include <string_view>

namespace vencode {

std::string_view KindName(Kind kind) noexcept {
  switch (kind) {
    case Kind::Invalid:
      return "invalid";
    case Kind::Bool:
      return "bool";
    case Kind::Int:
      return "int";
    case Kind::Uint:
      return "uint";
    case Kind::Float32:
      return "float32";
    case Kind::Float64:
      return "float64";
    case Kind::String:
      return "string";
    case Kind::Time:
      return "time";
    case Kind::Slice:
      return "slice";
    case Kind::Array:
      return "array";
    case Kind::Map:
      return "map";
    case Kind::Struct:
      return "struct";
    case Kind::Pointer:
      return "pointer";
    case Kind::Interface:
      return "interface";
    case Kind::Chan:
      return "chan";
    case Kind::Func:
      return "func";
    case Kind::Unsupported:
      return "unsupported";
  }
  return "unknown";
}

std::string_view KeyTypeName(KeyType keyType) noexcept {
  switch (keyType) {
    case KeyType::String:
      return "string";
    case KeyType::Int:
      return "int";
    case KeyType::Uint:
      return "uint";
    case KeyType::Float:
      return "float";
  }
  return "unknown";
}

}  // namespace vencode

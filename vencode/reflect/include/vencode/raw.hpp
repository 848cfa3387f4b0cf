#pragma once

#include <cstdint>
#include <vector>

#include "vencode/any.hpp"
#include "vencode/raw-bytes.hpp"

namespace vencode {

// Already encoded bytes, written verbatim to the output when the handle has the 'raw' option.
struct Raw {
  [[nodiscard]] bool isCodecEmpty() const noexcept { return bytes.empty(); }

  RawBytes bytes;
};

// Application-defined tagged extension value.
// Binary formats write 'data' as the payload. Text formats encode 'value' instead, if set.
struct RawExt {
  [[nodiscard]] bool isCodecEmpty() const noexcept { return data.empty() && value.isNil(); }

  std::uint64_t tag{0};
  RawBytes data;
  Any value;
};

// Sequence of alternating keys and values, encoded as a map.
template <class E>
class MapBySlice : public std::vector<E> {
 public:
  static constexpr bool kMapBySlice = true;

  using std::vector<E>::vector;
};

}  // namespace vencode

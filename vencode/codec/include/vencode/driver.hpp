#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "vencode/raw.hpp"
#include "vencode/timedef.hpp"
#include "vencode/value-ref.hpp"

namespace vencode {

class Extension;

// Low level writer of one wire format. The encoder walks values and calls these primitives in nesting order,
// the driver turns them into bytes on the encoder's writer.
class Driver {
 public:
  virtual ~Driver() = default;

  virtual void encodeNil() = 0;

  virtual void encodeInt(std::int64_t value) = 0;

  virtual void encodeUint(std::uint64_t value) = 0;

  virtual void encodeBool(bool value) = 0;

  virtual void encodeFloat32(float value) = 0;

  virtual void encodeFloat64(double value) = 0;

  virtual void encodeRawExt(const RawExt &rawExt) = 0;

  virtual void encodeExt(ValueRef value, std::uint64_t tag, const Extension &ext) = 0;

  virtual void encodeString(std::string_view value) = 0;

  virtual void encodeStringBytesRaw(std::span<const std::byte> value) = 0;

  virtual void encodeTime(SysTimePoint value) = 0;

  virtual void writeArrayStart(std::size_t len) = 0;

  virtual void writeArrayEnd() = 0;

  virtual void writeMapStart(std::size_t len) = 0;

  virtual void writeMapEnd() = 0;

  // Formats with separators between container elements return true to receive the three element hooks below.
  [[nodiscard]] virtual bool tracksContainerElements() const noexcept { return false; }

  virtual void writeArrayElem() {}

  virtual void writeMapElemKey() {}

  virtual void writeMapElemValue() {}

  // Key of a struct encoded as a map. 'plainAscii' tells that the name only contains [A-Za-z0-9_].
  virtual void encodeFieldName(std::string_view name, [[maybe_unused]] bool plainAscii) { encodeString(name); }

  // Called when the encoder is given a new output.
  virtual void reset() {}

  // Called once the outermost encode of a value completes.
  virtual void atEndOfEncode() {}
};

}  // namespace vencode

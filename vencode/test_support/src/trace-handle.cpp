#include "vencode/trace-handle.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "vencode/any.hpp"
#include "vencode/codec-options.hpp"
#include "vencode/driver.hpp"
#include "vencode/encoder.hpp"
#include "vencode/extension.hpp"
#include "vencode/raw-bytes.hpp"
#include "vencode/raw.hpp"
#include "vencode/timedef.hpp"
#include "vencode/value-ref.hpp"

namespace vencode::test {

TraceHandle::TraceHandle(CodecOptions options, TraceMode mode, bool trackElements)
    : Handle(options), _mode(mode), _trackElements(trackElements) {}

std::string_view TraceHandle::name() const noexcept {
  switch (_mode) {
    case TraceMode::Binary:
      return "trace-binary";
    case TraceMode::Text:
      return "trace-text";
    case TraceMode::Json:
      return "trace-json";
  }
  return "trace";
}

std::unique_ptr<Driver> TraceHandle::newDriver(Encoder &encoder) const {
  return std::make_unique<TraceDriver>(encoder, _mode, _trackElements);
}

std::string HexString(std::span<const std::byte> data) {
  static constexpr std::string_view kHexDigits = "0123456789abcdef";
  std::string hex;
  hex.reserve(data.size() * 2U);
  for (std::byte byte : data) {
    const auto value = std::to_integer<unsigned>(byte);
    hex.push_back(kHexDigits[value >> 4U]);
    hex.push_back(kHexDigits[value & 0xFU]);
  }
  return hex;
}

bool FitsInFloat32(double value) noexcept {
  if (std::isnan(value) || std::isinf(value)) {
    return true;
  }
  if (std::fabs(value) > static_cast<double>(std::numeric_limits<float>::max())) {
    return false;
  }
  return static_cast<double>(static_cast<float>(value)) == value;
}

void TraceDriver::encodeNil() { token("nil"); }

void TraceDriver::encodeInt(std::int64_t value) { token("i:{}", value); }

void TraceDriver::encodeUint(std::uint64_t value) { token("u:{}", value); }

void TraceDriver::encodeBool(bool value) { token("b:{}", value); }

void TraceDriver::encodeFloat32(float value) { token("f32:{}", value); }

void TraceDriver::encodeFloat64(double value) {
  if (_enc->options().optimumSize && FitsInFloat32(value)) {
    encodeFloat32(static_cast<float>(value));
  } else {
    token("f64:{}", value);
  }
}

void TraceDriver::encodeRawExt(const RawExt &rawExt) {
  if (_mode == TraceMode::Binary) {
    token("X{}:{}", rawExt.tag, HexString(rawExt.data.view()));
    return;
  }
  token("X{}", rawExt.tag);
  if (rawExt.value.isNil()) {
    encodeNil();
  } else {
    _enc->mustEncode(rawExt.value.ref());
  }
}

void TraceDriver::encodeExt(ValueRef value, std::uint64_t tag, const Extension &ext) {
  if (_mode == TraceMode::Binary) {
    token("x{}:{}", tag, HexString(ext.writeExt(value).view()));
    return;
  }
  token("x{}", tag);
  const Any converted = ext.convertExt(value);
  if (converted.isNil()) {
    encodeNil();
  } else {
    _enc->mustEncode(converted.ref());
  }
}

void TraceDriver::encodeString(std::string_view value) {
  if (_enc->options().stringToRaw) {
    encodeStringBytesRaw(std::span<const std::byte>(reinterpret_cast<const std::byte *>(value.data()), value.size()));
  } else {
    token("s:{}", value);
  }
}

void TraceDriver::encodeStringBytesRaw(std::span<const std::byte> value) { token("bin:{}", HexString(value)); }

void TraceDriver::encodeTime(SysTimePoint value) {
  token("t:{}", std::chrono::duration_cast<std::chrono::nanoseconds>(value.time_since_epoch()).count());
}

void TraceDriver::writeArrayStart(std::size_t len) { token("[{}", len); }

void TraceDriver::writeArrayEnd() { token("]"); }

void TraceDriver::writeMapStart(std::size_t len) { token("{{{}", len); }

void TraceDriver::writeMapEnd() { token("}}"); }

void TraceDriver::writeArrayElem() { token("|a"); }

void TraceDriver::writeMapElemKey() { token("|k"); }

void TraceDriver::writeMapElemValue() { token("|v"); }

void TraceDriver::encodeFieldName(std::string_view name, bool plainAscii) {
  if (_mode == TraceMode::Json && plainAscii) {
    _enc->writer().writeqstr(name);
    _enc->writer().writen1(std::byte{' '});
  } else {
    encodeString(name);
  }
}

void TraceDriver::reset() { ++_nbResets; }

void TraceDriver::atEndOfEncode() { ++_nbEndOfEncode; }

}  // namespace vencode::test

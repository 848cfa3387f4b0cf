#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "vencode/codec-options.hpp"
#include "vencode/driver.hpp"
#include "vencode/encoder.hpp"
#include "vencode/handle.hpp"
#include "vencode/raw-bytes.hpp"

namespace vencode::test {

enum class TraceMode : std::uint8_t { Binary, Text, Json };

// Handle of a test format writing each driver call as a readable token followed by a space:
//   nil  i:-3  u:4  b:true  f32:1.5  f64:2.25  s:abc  bin:00ff  t:<ns since epoch>
//   [n ... ]  for arrays, {n ... }  for maps, |a |k |v  for element hooks when tracked,
//   x<tag>:<hex> or x<tag> <value>  for extensions, X<tag>:<hex> or X<tag> <value>  for RawExt.
// With optimumSize, a float64 value that a float32 represents exactly is written as f32.
class TraceHandle : public Handle {
 public:
  explicit TraceHandle(CodecOptions options = {}, TraceMode mode = TraceMode::Binary, bool trackElements = false);

  [[nodiscard]] std::string_view name() const noexcept override;

  [[nodiscard]] bool isBinary() const noexcept override { return _mode == TraceMode::Binary; }

  [[nodiscard]] bool isJson() const noexcept override { return _mode == TraceMode::Json; }

  [[nodiscard]] std::unique_ptr<Driver> newDriver(Encoder &encoder) const override;

 private:
  TraceMode _mode;
  bool _trackElements;
};

class TraceDriver : public Driver {
 public:
  TraceDriver(Encoder &encoder, TraceMode mode, bool trackElements) noexcept
      : _enc(&encoder), _mode(mode), _trackElements(trackElements) {}

  void encodeNil() override;
  void encodeInt(std::int64_t value) override;
  void encodeUint(std::uint64_t value) override;
  void encodeBool(bool value) override;
  void encodeFloat32(float value) override;
  void encodeFloat64(double value) override;
  void encodeRawExt(const RawExt &rawExt) override;
  void encodeExt(ValueRef value, std::uint64_t tag, const Extension &ext) override;
  void encodeString(std::string_view value) override;
  void encodeStringBytesRaw(std::span<const std::byte> value) override;
  void encodeTime(SysTimePoint value) override;
  void writeArrayStart(std::size_t len) override;
  void writeArrayEnd() override;
  void writeMapStart(std::size_t len) override;
  void writeMapEnd() override;

  [[nodiscard]] bool tracksContainerElements() const noexcept override { return _trackElements; }

  void writeArrayElem() override;
  void writeMapElemKey() override;
  void writeMapElemValue() override;
  void encodeFieldName(std::string_view name, bool plainAscii) override;
  void reset() override;
  void atEndOfEncode() override;

  [[nodiscard]] std::size_t nbResets() const noexcept { return _nbResets; }

  [[nodiscard]] std::size_t nbEndOfEncode() const noexcept { return _nbEndOfEncode; }

 private:
  template <class... Args>
  void token(std::format_string<Args...> fmt, Args &&...args) {
    _enc->writer().writestr(std::format(fmt, std::forward<Args>(args)...));
    _enc->writer().writen1(std::byte{' '});
  }

  Encoder *_enc;
  TraceMode _mode;
  bool _trackElements;
  std::size_t _nbResets{0};
  std::size_t _nbEndOfEncode{0};
};

// Whether 'value' converts to float and back without loss. NaN and infinities do.
[[nodiscard]] bool FitsInFloat32(double value) noexcept;

// Lowercase hexadecimal rendering of 'data'.
std::string HexString(std::span<const std::byte> data);

// Trace of 'value' encoded with 'handle', without the final space. Throws EncodeError on failure.
template <class T>
std::string TraceOf(const Handle &handle, const T &value) {
  RawBytes out;
  Encoder encoder(handle, out);
  encoder.mustEncode(value);
  std::string_view trace = out.asString();
  if (trace.ends_with(' ')) {
    trace.remove_suffix(1);
  }
  return std::string(trace);
}

}  // namespace vencode::test

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "vencode/codec-fn.hpp"
#include "vencode/codec-options.hpp"
#include "vencode/driver.hpp"
#include "vencode/encode-error.hpp"
#include "vencode/encode-writer.hpp"
#include "vencode/handle.hpp"
#include "vencode/raw-bytes.hpp"
#include "vencode/recycling-pool.hpp"
#include "vencode/reflect.hpp"
#include "vencode/timedef.hpp"
#include "vencode/type-info.hpp"
#include "vencode/value-ref.hpp"
#include "vencode/vector.hpp"

namespace vencode {

enum class ContainerState : std::uint8_t { None, MapStart, MapKey, MapValue, ArrayStart, ArrayElem };

namespace internal {

// Types written directly to the driver by Encoder::encode when no extension is registered.
template <class T>
concept FastPathPrimitive = std::same_as<T, bool> || std::integral<T> || std::floating_point<T> ||
                            std::same_as<T, std::string> || std::same_as<T, std::string_view> ||
                            std::same_as<T, SysTimePoint>;

}  // namespace internal

// Walks values and emits them through the Driver of its Handle.
// An encoder needs an output before encoding: give one at construction or with reset(). It can be reset any
// number of times, keeping its internal buffers. Not thread safe.
// After a failure, the encoder refuses to encode until it is reset.
class Encoder {
 public:
  explicit Encoder(const Handle &handle);

  Encoder(const Handle &handle, RawBytes &out);

  Encoder(const Handle &handle, ByteSink &sink);

  Encoder(const Encoder &) = delete;
  Encoder &operator=(const Encoder &) = delete;

  ~Encoder();

  // Clears 'out' and encodes into it.
  void reset(RawBytes &out);

  void reset(ByteSink &sink);

  // Encodes 'value'. Failures are returned, never thrown.
  template <class T>
  EncodeResult encode(const T &value) {
    try {
      mustEncode(value);
    } catch (const EncodeError &err) {
      return failed(err);
    }
    return _err ? EncodeResult(*_err) : EncodeResult();
  }

  // Encodes 'value', throwing EncodeError on failure.
  // A failure of a nested encode() (from an encodeSelf or an extension) also makes the enclosing call fail.
  template <class T>
  void mustEncode(const T &value) {
    checkUsable();
    ++_calls;
    try {
      encodeTop(value);
    } catch (const EncodeError &err) {
      --_calls;
      _err = err;
      throw;
    }
    leave();
    checkUsable();
  }

  // Encodes 'value' into 'out' with a separate encoder of the same handle, ignoring registered extensions.
  // Meant for extensions reusing the engine for their payload.
  void sideEncode(ValueRef value, RawBytes &out) const;

  // Container primitives, for encodeSelf implementations.
  void mapStart(std::size_t len);
  void mapElemKey();
  void mapElemValue();
  void mapEnd();
  void arrayStart(std::size_t len);
  void arrayElem();
  void arrayEnd();

  [[nodiscard]] Driver &driver() noexcept { return *_driver; }

  [[nodiscard]] EncodeWriter &writer() noexcept { return _wr; }

  [[nodiscard]] const Handle &handle() const noexcept { return *_handle; }

  [[nodiscard]] const CodecOptions &options() const noexcept { return _handle->options(); }

  [[nodiscard]] ContainerState containerState() const noexcept { return _c; }

 private:
  friend class CodecFnCache;

  struct FieldRecord {
    const FieldInfo *field;
    ValueRef value;
  };

  struct CircularRefEntry {
    const TypeInfo *type;
    const void *ptr;
  };

  template <class T>
  void encodeTop(const T &value) {
    if constexpr (std::same_as<T, ValueRef>) {
      encodeValue(value, nullptr);
    } else if constexpr (std::same_as<T, std::nullptr_t>) {
      _driver->encodeNil();
    } else if constexpr (internal::FastPathPrimitive<T>) {
      if (_handle->hasExtensions()) {
        encodeValue(ValueOf(value), nullptr);
      } else {
        encodePrimitive(value);
      }
    } else if constexpr (std::is_array_v<T> && std::same_as<std::remove_cv_t<std::remove_extent_t<T>>, char>) {
      _driver->encodeString(std::string_view(value));
    } else {
      encodeValue(ValueOf(value), nullptr);
    }
  }

  template <class T>
  void encodePrimitive(const T &value) {
    if constexpr (std::same_as<T, bool>) {
      _driver->encodeBool(value);
    } else if constexpr (std::integral<T> && (std::is_signed_v<T> || std::same_as<T, char>)) {
      _driver->encodeInt(static_cast<std::int64_t>(value));
    } else if constexpr (std::integral<T>) {
      _driver->encodeUint(static_cast<std::uint64_t>(value));
    } else if constexpr (std::same_as<T, float>) {
      _driver->encodeFloat32(value);
    } else if constexpr (std::floating_point<T>) {
      _driver->encodeFloat64(static_cast<double>(value));
    } else if constexpr (std::same_as<T, SysTimePoint>) {
      _driver->encodeTime(value);
    } else {
      _driver->encodeString(value);
    }
  }

  void resetCommon();
  void checkUsable() const;
  void leave();
  EncodeResult failed(const EncodeError &err);

  void encodeValue(ValueRef rv, const CodecFn *fn);
  void pushCircularRef(ValueRef rv);
  [[nodiscard]] const CodecFn *elemFn(const TypeInfo &elemType) const;

  // strategies
  void selferMarshal(const CodecFnInfo &info, ValueRef rv);
  void ext(const CodecFnInfo &info, ValueRef rv);
  void rawExt(const CodecFnInfo &info, ValueRef rv);
  void binaryMarshal(const CodecFnInfo &info, ValueRef rv);
  void textMarshal(const CodecFnInfo &info, ValueRef rv);
  void jsonMarshal(const CodecFnInfo &info, ValueRef rv);
  void raw(const CodecFnInfo &info, ValueRef rv);
  void kBool(const CodecFnInfo &info, ValueRef rv);
  void kInt(const CodecFnInfo &info, ValueRef rv);
  void kUint(const CodecFnInfo &info, ValueRef rv);
  void kFloat32(const CodecFnInfo &info, ValueRef rv);
  void kFloat64(const CodecFnInfo &info, ValueRef rv);
  void kString(const CodecFnInfo &info, ValueRef rv);
  void kTime(const CodecFnInfo &info, ValueRef rv);
  void kSlice(const CodecFnInfo &info, ValueRef rv);
  void kArray(const CodecFnInfo &info, ValueRef rv);
  void kChan(const CodecFnInfo &info, ValueRef rv);
  void kMap(const CodecFnInfo &info, ValueRef rv);
  void kStruct(const CodecFnInfo &info, ValueRef rv);
  void kErr(const CodecFnInfo &info, ValueRef rv);

  // sequence helpers
  void kSeqW(ValueRef rv);
  void kSeqWMbs(ValueRef rv);

  // map helpers
  void kMapCanonical(ValueRef rv, const CodecFn *valFn);
  void kMapCanonicalOutOfBand(ValueRef rv, const CodecFn *valFn);

  // struct helpers
  [[nodiscard]] MissingFields missingFields(ValueRef rv) const;
  void encodeStructFieldKey(KeyType keyType, bool encNameAsciiAlphaNum, std::string_view encName);

  const Handle *_handle;
  EncodeWriter _wr;
  std::unique_ptr<Driver> _driver;
  RawBytes _b;
  RecyclingPool<vector<FieldRecord>> _fieldLists;
  RecyclingPool<RawBytes> _byteBufs;
  SmallVector<CircularRefEntry, 8> _ci;
  std::optional<EncodeError> _err;
  std::uint32_t _calls{0};
  ContainerState _c{ContainerState::None};
  bool _tracksElems;
};

}  // namespace vencode

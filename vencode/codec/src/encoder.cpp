#include "vencode/encoder.hpp"

#include <exception>
#include <memory>
#include <string>
#include <type_traits>

#include "vencode/codec-fn.hpp"
#include "vencode/config.hpp"
#include "vencode/driver.hpp"
#include "vencode/encode-error.hpp"
#include "vencode/encode-writer.hpp"
#include "vencode/extension.hpp"
#include "vencode/handle.hpp"
#include "vencode/kind.hpp"
#include "vencode/log.hpp"
#include "vencode/raw-bytes.hpp"
#include "vencode/raw.hpp"
#include "vencode/type-info.hpp"
#include "vencode/value-ref.hpp"

namespace vencode {

namespace {

// Calls a user provided method. Its exceptions are reported as CustomMarshalFailure.
template <class Fn>
auto CallUserHook(const TypeInfo &type, const char *what, Fn &&fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const EncodeError &) {
    throw;
  } catch (const std::exception &ex) {
    throw EncodeError(EncodeErrc::CustomMarshalFailure, "{} of {} failed: {}", what, type.name, ex.what());
  }
}

}  // namespace

Encoder::Encoder(const Handle &handle)
    : _handle(&handle),
      _driver(handle.newDriver(*this)),
      _err(EncodeError(EncodeErrc::UninitializedEncoder, "encoder has no output, reset it first")),
      _tracksElems(_driver->tracksContainerElements()) {}

Encoder::Encoder(const Handle &handle, RawBytes &out) : Encoder(handle) { reset(out); }

Encoder::Encoder(const Handle &handle, ByteSink &sink) : Encoder(handle) { reset(sink); }

Encoder::~Encoder() = default;

void Encoder::reset(RawBytes &out) {
  _wr.reset(out);
  resetCommon();
}

void Encoder::reset(ByteSink &sink) {
  _wr.reset(sink, options().writerBufferSize);
  resetCommon();
}

void Encoder::resetCommon() {
  _driver->reset();
  _ci.clear();
  // lists and buffers not given back by an aborted encode
  _fieldLists.recycleAll();
  _byteBufs.recycleAll();
  _c = ContainerState::None;
  _calls = 0;
  _err.reset();
}

void Encoder::checkUsable() const {
  if (VENCODE_UNLIKELY(_err.has_value())) {
    throw *_err;
  }
}

void Encoder::leave() {
  if (--_calls == 0) {
    try {
      _driver->atEndOfEncode();
      _wr.end();
    } catch (const EncodeError &err) {
      _err = err;
      throw;
    }
  }
}

EncodeResult Encoder::failed(const EncodeError &err) {
  log::debug("{} encode failed with {}: {}", _handle->name(), EncodeErrcName(err.errc()), err.what());
  return EncodeResult(err);
}

void Encoder::sideEncode(ValueRef value, RawBytes &out) const {
  while (value.kind() == Kind::Pointer || value.kind() == Kind::Interface) {
    value = value.elem();
  }
  Encoder side(*_handle, out);
  if (value.valid()) {
    side.encodeValue(value, &_handle->fnNoExt(*value.type()));
  } else {
    side._driver->encodeNil();
  }
  side._driver->atEndOfEncode();
  side._wr.end();
}

void Encoder::encodeValue(ValueRef rv, const CodecFn *fn) {
  bool pushed = false;
  for (bool resolved = false; !resolved;) {
    switch (rv.kind()) {
      case Kind::Invalid:
        _driver->encodeNil();
        return;
      case Kind::Pointer: {
        ValueRef pointee = rv.elem();
        if (!pointee.valid()) {
          _driver->encodeNil();
          return;
        }
        rv = pointee;
        if (options().checkCircularRef && rv.kind() == Kind::Struct) {
          pushCircularRef(rv);
          pushed = true;
          resolved = true;
        }
        break;
      }
      case Kind::Interface: {
        ValueRef concrete = rv.elem();
        if (!concrete.valid()) {
          _driver->encodeNil();
          return;
        }
        rv = concrete;
        break;
      }
      case Kind::Chan:
        [[fallthrough]];
      case Kind::Func:
        if (rv.type()->ops.isNil(rv.ptr())) {
          _driver->encodeNil();
          return;
        }
        resolved = true;
        break;
      default:
        resolved = true;
        break;
    }
  }

  if (fn == nullptr) {
    fn = &_handle->fn(*rv.type());
  }

  const CodecFnInfo &info = fn->info;
  if (!info.addrE || rv.addressable()) {
    (this->*fn->fe)(info, rv);
  } else if (info.addrEf) {
    // throwaway mutable copy
    std::shared_ptr<void> copy = rv.type()->ops.copy(rv.ptr());
    (this->*fn->fe)(info, ValueRef(*rv.type(), copy.get(), true));
  } else {
    throw EncodeError(EncodeErrc::UnsupportedValue, "{} needs a mutable value of type {} which cannot be copied",
                      fn->name, rv.type()->name);
  }

  if (pushed) {
    _ci.pop_back();
  }
}

void Encoder::pushCircularRef(ValueRef rv) {
  for (const CircularRefEntry &entry : _ci) {
    if (entry.ptr == rv.ptr() && entry.type == rv.type()) {
      throw EncodeError(EncodeErrc::CircularReference, "circular reference found: {} at {}", rv.type()->name,
                        rv.ptr());
    }
  }
  _ci.push_back(CircularRefEntry{rv.type(), rv.ptr()});
}

const CodecFn *Encoder::elemFn(const TypeInfo &elemType) const {
  const TypeInfo *type = &elemType;
  while (type->kind == Kind::Pointer) {
    type = type->elem();
  }
  // interfaces are resolved for each value
  return type->kind == Kind::Interface ? nullptr : &_handle->fn(*type);
}

void Encoder::selferMarshal(const CodecFnInfo &info, ValueRef rv) {
  CallUserHook(*info.type, "encodeSelf", [&] { info.type->ops.encodeSelf(rv.ptr(), *this); });
}

void Encoder::ext(const CodecFnInfo &info, ValueRef rv) {
  CallUserHook(*info.type, "extension", [&] { _driver->encodeExt(rv, info.extTag, *info.ext); });
}

void Encoder::rawExt([[maybe_unused]] const CodecFnInfo &info, ValueRef rv) {
  _driver->encodeRawExt(rv.as<RawExt>());
}

void Encoder::binaryMarshal(const CodecFnInfo &info, ValueRef rv) {
  const RawBytes bytes =
      CallUserHook(*info.type, "marshalBinary", [&] { return info.type->ops.marshalBinary(rv.ptr()); });
  _driver->encodeStringBytesRaw(bytes.view());
}

void Encoder::textMarshal(const CodecFnInfo &info, ValueRef rv) {
  const std::string text =
      CallUserHook(*info.type, "marshalText", [&] { return info.type->ops.marshalText(rv.ptr()); });
  _driver->encodeString(text);
}

void Encoder::jsonMarshal(const CodecFnInfo &info, ValueRef rv) {
  const std::string json =
      CallUserHook(*info.type, "marshalJson", [&] { return info.type->ops.marshalJson(rv.ptr()); });
  // already in the output format
  _wr.writestr(json);
}

void Encoder::raw([[maybe_unused]] const CodecFnInfo &info, ValueRef rv) {
  const Raw &rawValue = rv.as<Raw>();
  if (!options().raw) {
    throw EncodeError(EncodeErrc::RawDisallowed, "Raw value of {} bytes cannot be encoded, raw option is disabled",
                      rawValue.bytes.size());
  }
  _wr.writeb(rawValue.bytes.view());
}

void Encoder::kBool(const CodecFnInfo &info, ValueRef rv) { _driver->encodeBool(info.type->ops.getBool(rv.ptr())); }

void Encoder::kInt(const CodecFnInfo &info, ValueRef rv) { _driver->encodeInt(info.type->ops.getInt(rv.ptr())); }

void Encoder::kUint(const CodecFnInfo &info, ValueRef rv) { _driver->encodeUint(info.type->ops.getUint(rv.ptr())); }

void Encoder::kFloat32(const CodecFnInfo &info, ValueRef rv) {
  _driver->encodeFloat32(static_cast<float>(info.type->ops.getFloat(rv.ptr())));
}

void Encoder::kFloat64(const CodecFnInfo &info, ValueRef rv) {
  _driver->encodeFloat64(info.type->ops.getFloat(rv.ptr()));
}

void Encoder::kString(const CodecFnInfo &info, ValueRef rv) {
  // null C strings
  if (info.type->ops.isNil != nullptr && info.type->ops.isNil(rv.ptr())) {
    _driver->encodeNil();
    return;
  }
  _driver->encodeString(info.type->ops.getString(rv.ptr()));
}

void Encoder::kTime(const CodecFnInfo &info, ValueRef rv) { _driver->encodeTime(info.type->ops.getTime(rv.ptr())); }

void Encoder::kErr(const CodecFnInfo &info, [[maybe_unused]] ValueRef rv) {
  throw EncodeError(EncodeErrc::UnsupportedValue, "unsupported value of type {} (kind {})", info.type->name,
                    KindName(info.type->kind));
}

void Encoder::mapStart(std::size_t len) {
  _driver->writeMapStart(len);
  _c = ContainerState::MapStart;
}

void Encoder::mapElemKey() {
  if (_tracksElems) {
    _driver->writeMapElemKey();
  }
  _c = ContainerState::MapKey;
}

void Encoder::mapElemValue() {
  if (_tracksElems) {
    _driver->writeMapElemValue();
  }
  _c = ContainerState::MapValue;
}

void Encoder::mapEnd() {
  _driver->writeMapEnd();
  _c = ContainerState::None;
}

void Encoder::arrayStart(std::size_t len) {
  _driver->writeArrayStart(len);
  _c = ContainerState::ArrayStart;
}

void Encoder::arrayElem() {
  if (_tracksElems) {
    _driver->writeArrayElem();
  }
  _c = ContainerState::ArrayElem;
}

void Encoder::arrayEnd() {
  _driver->writeArrayEnd();
  _c = ContainerState::None;
}

}  // namespace vencode

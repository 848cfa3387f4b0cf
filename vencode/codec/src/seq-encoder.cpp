#include <chrono>
#include <cstddef>

#include "vencode/driver.hpp"
#include "vencode/encode-error.hpp"
#include "vencode/encoder.hpp"
#include "vencode/kind.hpp"
#include "vencode/log.hpp"
#include "vencode/type-info.hpp"
#include "vencode/value-ref.hpp"

namespace vencode {

void Encoder::kSlice(const CodecFnInfo &info, ValueRef rv) {
  const TypeInfo &type = *info.type;
  if (type.mapBySlice) {
    kSeqWMbs(rv);
  } else if (type.isByteSequence()) {
    _driver->encodeStringBytesRaw(type.ops.bytes(rv.ptr()));
  } else {
    kSeqW(rv);
  }
}

void Encoder::kArray(const CodecFnInfo &info, ValueRef rv) { kSlice(info, rv); }

void Encoder::kSeqW(ValueRef rv) {
  const TypeInfo &type = *rv.type();
  const TypeInfo &elemType = *type.elem();
  const std::size_t len = type.ops.len(rv.ptr());
  arrayStart(len);
  if (len != 0) {
    const CodecFn *fn = elemFn(elemType);
    for (std::size_t pos = 0; pos < len; ++pos) {
      arrayElem();
      encodeValue(ValueRef(elemType, type.ops.index(rv.ptr(), pos), rv.addressable()), fn);
    }
  }
  arrayEnd();
}

void Encoder::kSeqWMbs(ValueRef rv) {
  const TypeInfo &type = *rv.type();
  const TypeInfo &elemType = *type.elem();
  const std::size_t len = type.ops.len(rv.ptr());
  if (len % 2 == 1) {
    throw EncodeError(EncodeErrc::MalformedFlattenedSequence, "map by slice {} has an odd length {}", type.name, len);
  }
  mapStart(len / 2);
  if (len != 0) {
    const CodecFn *fn = elemFn(elemType);
    for (std::size_t pos = 0; pos < len; ++pos) {
      if (pos % 2 == 0) {
        mapElemKey();
      } else {
        mapElemValue();
      }
      encodeValue(ValueRef(elemType, type.ops.index(rv.ptr(), pos), rv.addressable()), fn);
    }
  }
  mapEnd();
}

void Encoder::kChan(const CodecFnInfo &info, ValueRef rv) {
  const TypeInfo &type = *info.type;
  if (!CanRecv(type.chanDir)) {
    throw EncodeError(EncodeErrc::SendOnlyChannel, "cannot receive from send-only channel {}", type.name);
  }
  const std::chrono::milliseconds timeout = options().chanRecvTimeout;
  log::trace("Draining {} with a timeout of {} ms", type.name, timeout.count());
  if (type.ops.drainBytes != nullptr) {
    _b.clear();
    type.ops.drainBytes(rv.ptr(), timeout, _b);
    _driver->encodeStringBytesRaw(_b.view());
  } else {
    const OwnedValue drained = type.ops.drain(rv.ptr(), timeout);
    kSeqW(drained.ref);
  }
}

}  // namespace vencode

#include "vencode/codec-fn.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>

#include "vencode/encoder.hpp"
#include "vencode/extension.hpp"
#include "vencode/handle.hpp"
#include "vencode/kind.hpp"
#include "vencode/log.hpp"
#include "vencode/type-info.hpp"

namespace vencode {

const CodecFn &CodecFnCache::get(const Handle &handle, const TypeInfo &type) {
  {
    std::shared_lock lock(_mutex);
    auto it = _fns.find(&type);
    if (it != _fns.end()) {
      return *it->second;
    }
  }

  auto built = std::make_unique<const CodecFn>(build(handle, type));

  std::unique_lock lock(_mutex);
  auto [it, inserted] = _fns.try_emplace(&type, std::move(built));
  if (inserted) {
    log::debug("{}: type {} encoded with '{}'{}", handle.name(), type.name, it->second->name,
               it->second->info.addrE ? " (needs a mutable value)" : "");
  }
  return *it->second;
}

CodecFn CodecFnCache::build(const Handle &handle, const TypeInfo &type) const {
  CodecFn fn;
  CodecFnInfo &info = fn.info;
  info.type = &type;

  const TypeCapabilities &caps = type.caps;
  const ExtensionEntry *extEntry = _checkExt ? handle.findExt(type) : nullptr;

  // first match wins
  if (caps.selfer) {
    fn.fe = &Encoder::selferMarshal;
    fn.name = "selfer";
    info.addrE = caps.selferNeedsAddr;
  } else if (extEntry != nullptr) {
    fn.fe = &Encoder::ext;
    fn.name = "ext";
    info.ext = extEntry->ext.get();
    info.extTag = extEntry->tag;
  } else if (caps.rawExt) {
    fn.fe = &Encoder::rawExt;
    fn.name = "rawExt";
  } else if (handle.isBinary() && caps.binaryMarshaler) {
    fn.fe = &Encoder::binaryMarshal;
    fn.name = "binaryMarshal";
    info.addrE = caps.binaryMarshalerNeedsAddr;
  } else if (!handle.isBinary() && caps.textMarshaler) {
    fn.fe = &Encoder::textMarshal;
    fn.name = "textMarshal";
    info.addrE = caps.textMarshalerNeedsAddr;
  } else if (handle.isJson() && caps.jsonMarshaler) {
    fn.fe = &Encoder::jsonMarshal;
    fn.name = "jsonMarshal";
    info.addrE = caps.jsonMarshalerNeedsAddr;
  } else if (caps.raw) {
    fn.fe = &Encoder::raw;
    fn.name = "raw";
  } else {
    switch (type.kind) {
      case Kind::Bool:
        fn.fe = &Encoder::kBool;
        break;
      case Kind::Int:
        fn.fe = &Encoder::kInt;
        break;
      case Kind::Uint:
        fn.fe = &Encoder::kUint;
        break;
      case Kind::Float32:
        fn.fe = &Encoder::kFloat32;
        break;
      case Kind::Float64:
        fn.fe = &Encoder::kFloat64;
        break;
      case Kind::String:
        fn.fe = &Encoder::kString;
        break;
      case Kind::Time:
        fn.fe = &Encoder::kTime;
        break;
      case Kind::Slice:
        fn.fe = &Encoder::kSlice;
        break;
      case Kind::Array:
        fn.fe = &Encoder::kArray;
        break;
      case Kind::Chan:
        fn.fe = &Encoder::kChan;
        break;
      case Kind::Map:
        fn.fe = &Encoder::kMap;
        break;
      case Kind::Struct:
        fn.fe = &Encoder::kStruct;
        // the missing fields method may need a mutable value, which is taken care of by the struct encoder.
        break;
      default:
        fn.fe = &Encoder::kErr;
        break;
    }
    fn.name = fn.fe == &Encoder::kErr ? std::string_view("unsupported") : KindName(type.kind);
  }

  info.addrEf = info.addrE && caps.copyable;
  return fn;
}

}  // namespace vencode

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
#include <type_traits>

#include "vencode/driver.hpp"
#include "vencode/encoder.hpp"
#include "vencode/kind.hpp"
#include "vencode/raw-bytes.hpp"
#include "vencode/timedef.hpp"
#include "vencode/type-info.hpp"
#include "vencode/value-ref.hpp"
#include "vencode/vector.hpp"

namespace vencode {

namespace {

template <class Fn>
void ForEachEntry(const TypeInfo &mapType, const void *map, Fn &&fn) {
  using FnType = std::remove_reference_t<Fn>;
  mapType.ops.forEachEntry(map, &fn, [](void *ctx, const void *key, const void *value) {
    (*static_cast<FnType *>(ctx))(key, value);
  });
}

template <class K>
struct KeyedEntry {
  K key;
  const void *value;
};

// Entries of the map with their keys read by 'getKey', in ascending key order.
template <class K, class GetKey, class Less = std::ranges::less>
vector<KeyedEntry<K>> SortedEntries(const TypeInfo &mapType, const void *map, GetKey getKey, Less less = {}) {
  vector<KeyedEntry<K>> entries;
  entries.reserve(mapType.ops.len(map));
  ForEachEntry(mapType, map, [&entries, getKey](const void *key, const void *value) {
    entries.push_back(KeyedEntry<K>{static_cast<K>(getKey(key)), value});
  });
  std::ranges::sort(entries, less, &KeyedEntry<K>::key);
  return entries;
}

// NaN sorts first.
struct FloatKeyLess {
  bool operator()(double lhs, double rhs) const noexcept {
    return lhs < rhs || (std::isnan(lhs) && !std::isnan(rhs));
  }
};

}  // namespace

void Encoder::kMap(const CodecFnInfo &info, ValueRef rv) {
  const TypeInfo &type = *info.type;
  const std::size_t len = type.ops.len(rv.ptr());
  mapStart(len);
  if (len == 0) {
    mapEnd();
    return;
  }

  const TypeInfo &valType = *type.elem();
  const CodecFn *valFn = elemFn(valType);

  if (options().canonical) {
    kMapCanonical(rv, valFn);
    mapEnd();
    return;
  }

  const TypeInfo &keyType = *type.key();
  const bool keyIsString = keyType.kind == Kind::String;
  const CodecFn *keyFn = keyIsString ? nullptr : elemFn(keyType);
  const bool addressable = rv.addressable();

  ForEachEntry(type, rv.ptr(), [&](const void *key, const void *value) {
    mapElemKey();
    if (keyIsString) {
      _driver->encodeString(keyType.ops.getString(key));
    } else {
      // map keys are never mutable
      encodeValue(ValueRef(keyType, key, false), keyFn);
    }
    mapElemValue();
    encodeValue(ValueRef(valType, value, addressable), valFn);
  });

  mapEnd();
}

void Encoder::kMapCanonical(ValueRef rv, const CodecFn *valFn) {
  const TypeInfo &type = *rv.type();
  const TypeInfo &keyType = *type.key();
  const TypeInfo &valType = *type.elem();
  const TypeOps &keyOps = keyType.ops;
  const bool addressable = rv.addressable();

  const auto emitSorted = [&](const auto &entries, auto &&emitKey) {
    for (const auto &entry : entries) {
      mapElemKey();
      emitKey(entry.key);
      mapElemValue();
      encodeValue(ValueRef(valType, entry.value, addressable), valFn);
    }
  };

  switch (keyType.kind) {
    case Kind::Bool:
      emitSorted(SortedEntries<bool>(type, rv.ptr(), keyOps.getBool), [this](bool key) { _driver->encodeBool(key); });
      break;
    case Kind::Int:
      emitSorted(SortedEntries<std::int64_t>(type, rv.ptr(), keyOps.getInt),
                 [this](std::int64_t key) { _driver->encodeInt(key); });
      break;
    case Kind::Uint:
      emitSorted(SortedEntries<std::uint64_t>(type, rv.ptr(), keyOps.getUint),
                 [this](std::uint64_t key) { _driver->encodeUint(key); });
      break;
    case Kind::Float32:
      emitSorted(SortedEntries<double>(type, rv.ptr(), keyOps.getFloat, FloatKeyLess{}),
                 [this](double key) { _driver->encodeFloat32(static_cast<float>(key)); });
      break;
    case Kind::Float64:
      emitSorted(SortedEntries<double>(type, rv.ptr(), keyOps.getFloat, FloatKeyLess{}),
                 [this](double key) { _driver->encodeFloat64(key); });
      break;
    case Kind::String:
      emitSorted(SortedEntries<std::string_view>(type, rv.ptr(), keyOps.getString),
                 [this](std::string_view key) { _driver->encodeString(key); });
      break;
    case Kind::Time:
      emitSorted(SortedEntries<SysTimePoint>(type, rv.ptr(), keyOps.getTime),
                 [this](SysTimePoint key) { _driver->encodeTime(key); });
      break;
    default:
      kMapCanonicalOutOfBand(rv, valFn);
      break;
  }
}

// Keys without a natural order are encoded separately and sorted by their encoded bytes.
void Encoder::kMapCanonicalOutOfBand(ValueRef rv, const CodecFn *valFn) {
  struct EncodedKey {
    std::size_t begin;
    std::size_t end;
    const void *value;
  };

  const TypeInfo &type = *rv.type();
  const TypeInfo &keyType = *type.key();
  const TypeInfo &valType = *type.elem();

  RawBytes &keyBytes = *_byteBufs.acquire();
  vector<EncodedKey> keys;
  keys.reserve(type.ops.len(rv.ptr()));
  {
    Encoder keyEncoder(*_handle, keyBytes);
    ForEachEntry(type, rv.ptr(), [&](const void *key, const void *value) {
      const std::size_t begin = keyBytes.size();
      keyEncoder.mustEncode(ValueRef(keyType, key, false));
      keys.push_back(EncodedKey{begin, keyBytes.size(), value});
    });
  }

  const auto keyView = [&keyBytes](const EncodedKey &key) {
    return std::span<const std::byte>(keyBytes.data() + key.begin, key.end - key.begin);
  };
  std::ranges::sort(keys, [&keyView](const EncodedKey &lhs, const EncodedKey &rhs) {
    return std::ranges::lexicographical_compare(keyView(lhs), keyView(rhs));
  });

  for (const EncodedKey &key : keys) {
    mapElemKey();
    _wr.writeb(keyView(key));
    mapElemValue();
    encodeValue(ValueRef(valType, key.value, rv.addressable()), valFn);
  }

  _byteBufs.release(&keyBytes);
}

}  // namespace vencode

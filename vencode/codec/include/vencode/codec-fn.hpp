#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>

#include "vencode/type-info.hpp"
#include "vencode/value-ref.hpp"

namespace vencode {

class Encoder;
class Extension;
class Handle;

struct CodecFnInfo {
  const TypeInfo *type{nullptr};
  const Extension *ext{nullptr};
  std::uint64_t extTag{0};
  // the handler needs a mutable value
  bool addrE{false};
  // a mutable copy can be made when the value is not mutable
  bool addrEf{false};
};

using EncodeFn = void (Encoder::*)(const CodecFnInfo &, ValueRef);

// Encoding strategy of a type for a given handle, selected once.
struct CodecFn {
  CodecFnInfo info;
  EncodeFn fe{nullptr};
  std::string_view name;
};

// Thread safe cache of the CodecFn of each type. Entries are never removed nor modified once published.
class CodecFnCache {
 public:
  explicit CodecFnCache(bool checkExt) noexcept : _checkExt(checkExt) {}

  const CodecFn &get(const Handle &handle, const TypeInfo &type);

 private:
  [[nodiscard]] CodecFn build(const Handle &handle, const TypeInfo &type) const;

  std::shared_mutex _mutex;
  std::unordered_map<const TypeInfo *, std::unique_ptr<const CodecFn>> _fns;
  bool _checkExt;
};

}  // namespace vencode
